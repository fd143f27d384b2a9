#include "workshop/error.hpp"
#include "workshop/lesson.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <string>

namespace {

using workshop::ErrorKind;
using workshop::LessonLoader;
using workshop::LessonStatus;
using workshop::testing::read_file;
using workshop::testing::TempDir;
using workshop::testing::TestSuite;
using workshop::testing::WorkshopFixture;
using workshop::testing::write_file;
namespace spoken = workshop::spoken;
namespace programming = workshop::programming;

void test_load_from_path(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  const auto dir = fixture.add_lesson("de", "py", "01-hallo", "InProgress");

  const auto lesson = workshop::load_lesson_from_path(dir);
  suite.require(lesson.name() == "01-hallo", "Lesson name should be the directory name");
  suite.require(lesson.spoken_language() == spoken::Code::de, "Spoken language from grandparent");
  suite.require(lesson.programming_language() == programming::Code::py,
                "Programming language from parent");
  suite.require(!lesson.text_loaded() && !lesson.metadata_loaded(),
                "Content should not be read while loading");
  suite.require(lesson.text() == "# 01-hallo\n", "Lesson text should load on demand");
  suite.require(lesson.metadata().status == LessonStatus::InProgress, "Status should be read");
  suite.require(lesson.text_loaded() && lesson.metadata_loaded(), "Slots should now be loaded");

  const auto trailing = workshop::load_lesson_from_path(dir.string() + "/");
  suite.require(trailing.name() == "01-hallo", "Trailing separator should be tolerated");
}

void test_load_from_path_validates_eagerly(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  const auto no_text = fixture.add_lesson("en", "rs", "01-no-text");
  std::filesystem::remove(no_text / "lesson.md");
  suite.require_error(ErrorKind::LessonTextFileMissing,
                      [&no_text] { workshop::load_lesson_from_path(no_text); },
                      "Missing lesson.md should fail immediately");

  const auto no_meta = fixture.add_lesson("en", "rs", "02-no-meta");
  std::filesystem::remove(no_meta / "lesson.yaml");
  suite.require_error(ErrorKind::LessonMetadataFileMissing,
                      [&no_meta] { workshop::load_lesson_from_path(no_meta); },
                      "Missing lesson.yaml should fail immediately");

  suite.require_error(ErrorKind::LessonDataDirNotFound,
                      [&fixture] {
                        workshop::load_lesson_from_path(fixture.root() / "en" / "rs" / "99-gone");
                      },
                      "Missing lesson directory should fail");
}

void test_load_from_path_requires_language_pair(TestSuite& suite) {
  TempDir tmp;
  write_file(tmp.path() / "en" / "misc" / "01-a" / "lesson.md", "text");
  write_file(tmp.path() / "en" / "misc" / "01-a" / "lesson.yaml", "title: a\ndescription: b\n");
  suite.require_error(ErrorKind::NoProgrammingLanguageSpecified,
                      [&tmp] { workshop::load_lesson_from_path(tmp.path() / "en" / "misc" / "01-a"); },
                      "Parent that is not a programming code should fail");

  write_file(tmp.path() / "misc" / "rs" / "01-b" / "lesson.md", "text");
  write_file(tmp.path() / "misc" / "rs" / "01-b" / "lesson.yaml", "title: a\ndescription: b\n");
  suite.require_error(ErrorKind::NoSpokenLanguageSpecified,
                      [&tmp] { workshop::load_lesson_from_path(tmp.path() / "misc" / "rs" / "01-b"); },
                      "Grandparent that is not a spoken code should fail");

  suite.require_error(ErrorKind::NoProgrammingLanguageSpecified,
                      [] { workshop::load_lesson_from_path("01-shallow"); },
                      "Path too shallow for a language pair should fail");
}

void test_builder_requires_languages(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  const auto dir = fixture.add_lesson("en", "rs", "01-a");

  suite.require_error(ErrorKind::NoSpokenLanguageSpecified,
                      [&dir] {
                        LessonLoader("01-a").path(dir).programming_language(programming::Code::rs).load();
                      },
                      "Builder without spoken language should fail");
  suite.require_error(ErrorKind::NoProgrammingLanguageSpecified,
                      [&dir] { LessonLoader("01-a").path(dir).spoken_language(spoken::Code::en).load(); },
                      "Builder without programming language should fail");
  suite.require_error(ErrorKind::LessonDataDirNotFound,
                      [] {
                        LessonLoader("01-a")
                            .spoken_language(spoken::Code::en)
                            .programming_language(programming::Code::rs)
                            .load();
                      },
                      "Builder without a path should fail");

  const auto lesson = LessonLoader("01-a")
                          .path(dir)
                          .spoken_language(spoken::Code::en)
                          .programming_language(programming::Code::rs)
                          .load();
  suite.require(lesson.path() == dir, "Builder should keep the lesson path");
}

void test_status_write_through(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  const auto dir = fixture.add_lesson("en", "rs", "01-a");

  auto lesson = workshop::load_lesson_from_path(dir);
  const auto copy = lesson;
  suite.require(lesson.metadata().status == LessonStatus::NotStarted, "Initial status");

  const auto updated = lesson.update_status(LessonStatus::Completed);
  suite.require(updated.status == LessonStatus::Completed, "update_status returns new metadata");
  suite.require(updated.title == "01-a", "Other fields should be preserved");
  suite.require(read_file(dir / "lesson.yaml").find("status: Completed") != std::string::npos,
                "lesson.yaml should be rewritten by update_status");

  write_file(dir / "lesson.yaml", "title: changed\ndescription: elsewhere\nstatus: InProgress\n");
  suite.require(lesson.metadata().status == LessonStatus::Completed,
                "Cached metadata should reflect the update without a reread");
  suite.require(copy.metadata().status == LessonStatus::Completed,
                "Copies should observe the update");

  auto fresh = workshop::load_lesson_from_path(dir);
  fresh.update_status(LessonStatus::Completed);
  const auto reread = workshop::load_lesson_from_path(dir);
  suite.require(reread.metadata().status == LessonStatus::Completed,
                "lesson.yaml on disk should reflect the update");
  suite.require(reread.metadata().title == "changed", "Title should round-trip through disk");
  suite.require(read_file(dir / "lesson.yaml").find("status: Completed") != std::string::npos,
                "Status should be written in the lesson.yaml spelling");
}

void test_update_status_loads_first(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  const auto dir = fixture.add_lesson("en", "rs", "01-a", "InProgress");

  auto lesson = workshop::load_lesson_from_path(dir);
  suite.require(!lesson.metadata_loaded(), "Metadata should start unloaded");
  const auto updated = lesson.update_status(LessonStatus::NotStarted);
  suite.require(updated.description == "About 01-a", "Unloaded metadata should be read first");
  suite.require(lesson.metadata_loaded(), "Update should leave metadata loaded");
}

void test_status_strings(TestSuite& suite) {
  suite.require(workshop::display_name(LessonStatus::NotStarted) == "Not Started", "Display");
  suite.require(workshop::display_name(LessonStatus::InProgress) == "In Progress", "Display");
  suite.require(workshop::to_string(LessonStatus::Completed) == "Completed", "Spelling");
  suite.require(workshop::lesson_status_from_string("InProgress") == LessonStatus::InProgress,
                "Parse status");
  suite.require(!workshop::lesson_status_from_string("Done").has_value(), "Unknown status");

  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  const auto dir = fixture.add_lesson("en", "rs", "01-a", "Done");
  const auto lesson = workshop::load_lesson_from_path(dir);
  suite.require_error(ErrorKind::YamlParsing, [&lesson] { lesson.metadata(); },
                      "Unknown status in lesson.yaml should fail to parse");
}

} // namespace

int main() {
  TestSuite suite;
  test_load_from_path(suite);
  test_load_from_path_validates_eagerly(suite);
  test_load_from_path_requires_language_pair(suite);
  test_builder_requires_languages(suite);
  test_status_write_through(suite);
  test_update_status_loads_first(suite);
  test_status_strings(suite);
  return suite.finish("Lesson");
}
