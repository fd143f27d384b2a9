#include "workshop/error.hpp"
#include "workshop/workshop_data.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>

namespace {

using workshop::ErrorKind;
using workshop::WorkshopData;
using workshop::WorkshopLoader;
using workshop::testing::TempDir;
using workshop::testing::TestSuite;
using workshop::testing::WorkshopFixture;
using workshop::testing::write_file;
namespace spoken = workshop::spoken;
namespace programming = workshop::programming;

WorkshopData load(const WorkshopFixture& fixture) {
  return WorkshopLoader(fixture.name()).path(fixture.parent()).load();
}

void test_description_falls_back_to_default(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  fixture.add_spoken("en", "English description");
  fixture.add_spoken("fr", "Description en français");

  const auto data = load(fixture);
  suite.require(data.description(spoken::Code::de) == "English description",
                "Absent de should fall back to the en default");
  suite.require(data.description(spoken::Code::fr) == "Description en français",
                "Present fr should be returned directly");
  suite.require(data.description(std::nullopt) == "English description",
                "No request should resolve to the default");
}

void test_description_falls_back_to_only_member(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "solo");
  fixture.add_spoken("fr", "Seulement en français");

  const auto data = load(fixture);
  suite.require(data.description(std::nullopt) == "Seulement en français",
                "Missing default should fall back to the remaining key");
  suite.require(data.metadata(spoken::Code::en).title == "solo (fr)",
                "Metadata should use the same fallback");
}

void test_arbitrary_member_is_smallest_code(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "pair");
  fixture.add_spoken("it", "Italiano");
  fixture.add_spoken("de", "Deutsch");

  const auto data = load(fixture);
  suite.require(data.description(spoken::Code::ja) == "Deutsch",
                "Fallback past the default should pick the smallest code");
}

void test_empty_maps_are_errors(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "empty");
  std::filesystem::create_directories(fixture.root() / "notes");

  const auto data = load(fixture);
  suite.require(data.all_spoken_languages().empty(), "No spoken languages should be found");
  suite.require_error(ErrorKind::WorkshopNoDescriptions,
                      [&data] { data.description(spoken::Code::en); },
                      "Empty descriptions should fail");
  suite.require_error(ErrorKind::WorkshopNoMetadata, [&data] { data.metadata(std::nullopt); },
                      "Empty metadata should fail");
  suite.require_error(ErrorKind::WorkshopNoSetupInstructions,
                      [&data] { data.setup_instructions(std::nullopt, std::nullopt); },
                      "Empty setup instructions should fail");
  suite.require_error(ErrorKind::WorkshopNoLessonsData,
                      [&data] { data.lessons(std::nullopt, std::nullopt); },
                      "Empty lessons should fail");
  suite.require(data.license() == "MIT License\n", "License should still load");
}

void test_two_level_fallback(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "rusty", "en", "py");
  fixture.add_spoken("en", "English");
  fixture.add_programming("en", "rs", "cargo install");

  const auto data = load(fixture);
  suite.require(data.setup_instructions(spoken::Code::en, programming::Code::py) ==
                    "cargo install",
                "Absent py default should fall back to rs");
  const auto [s, p] = data.resolve_languages(spoken::Code::en, programming::Code::py);
  suite.require(s == spoken::Code::en && p == programming::Code::rs,
                "resolve_languages should report the resolved pair");
}

void test_empty_inner_map(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "bare");
  fixture.add_spoken("en", "English");

  const auto data = load(fixture);
  suite.require_error(ErrorKind::WorkshopNoProgrammingLanguagesForSpokenLanguage,
                      [&data] { data.setup_instructions(spoken::Code::en, std::nullopt); },
                      "Spoken key without programming languages should fail");
  suite.require_error(ErrorKind::WorkshopNoProgrammingLanguagesForSpokenLanguage,
                      [&data] { data.lessons(spoken::Code::en, programming::Code::rs); },
                      "Lessons should fail the same way");
}

void test_is_selected(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "poly");
  fixture.add_spoken("en", "English");
  fixture.add_spoken("fr", "Français");
  fixture.add_programming("en", "rs", "rust");
  fixture.add_programming("en", "py", "python");
  fixture.add_programming("fr", "rs", "rust");

  const auto data = load(fixture);
  suite.require(data.is_selected(std::nullopt, std::nullopt), "(None, None) is selected");
  suite.require(!data.is_selected(spoken::Code::de, std::nullopt), "(de, None) is not selected");
  suite.require(!data.is_selected(spoken::Code::fr, programming::Code::py),
                "(fr, py) is not selected");
  suite.require(data.is_selected(std::nullopt, programming::Code::py), "(None, py) is selected");
  suite.require(data.is_selected(spoken::Code::en, programming::Code::rs), "(en, rs) is selected");
  suite.require(!data.is_selected(std::nullopt, programming::Code::go), "(None, go) is not");

  const auto all_programming = data.all_programming_languages();
  suite.require(all_programming.size() == 2 && all_programming[0] == programming::Code::py &&
                    all_programming[1] == programming::Code::rs,
                "Programming inventory should be sorted and unique");
  const auto for_rs = data.spoken_languages_for(programming::Code::rs);
  suite.require(for_rs.size() == 2, "Both spoken languages offer rs");
  suite.require(data.programming_languages_for(spoken::Code::fr).size() == 1,
                "fr offers one programming language");
  suite.require(data.programming_languages_for(spoken::Code::de).empty(), "de offers none");
}

void test_skips_non_language_directories(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "skippy");
  fixture.add_spoken("en", "English");
  fixture.add_programming("en", "rs", "rust");
  std::filesystem::create_directories(fixture.root() / "notes");
  std::filesystem::create_directories(fixture.root() / "en" / "drafts");

  const auto data = load(fixture);
  const auto spoken_languages = data.all_spoken_languages();
  suite.require(spoken_languages.size() == 1 && spoken_languages[0] == spoken::Code::en,
                "Only the en directory should be discovered");
  suite.require(data.programming_languages_for(spoken::Code::en).size() == 1,
                "Non-code programming directories should be skipped");
}

void test_skips_mixed_case_directories(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "intro");
  fixture.add_spoken("en", "English");
  fixture.add_programming("en", "rs", "rust");
  fixture.add_programming("en", "RS", "upper rust");
  fixture.add_spoken("FR", "Français");
  fixture.add_programming("FR", "rs", "rust");

  const auto data = load(fixture);
  const auto spoken_languages = data.all_spoken_languages();
  suite.require(spoken_languages.size() == 1 && spoken_languages[0] == spoken::Code::en,
                "Upper-case spoken directories should be skipped");
  suite.require(data.setup_instructions(spoken::Code::en, programming::Code::rs) == "rust",
                "Only the lower-case rs directory should be discovered");
  suite.require(data.deps_script_path(spoken::Code::en, programming::Code::rs) ==
                    fixture.root() / "en" / "rs" / "deps.py",
                "Paths should point at the discovered directory");
}

void test_structural_errors(TestSuite& suite) {
  TempDir tmp;
  suite.require_error(ErrorKind::WorkshopNotFound,
                      [&tmp] { WorkshopLoader("missing").path(tmp.path()).load(); },
                      "Missing workshop root should fail");
  suite.require_error(ErrorKind::WorkshopDataDirNotFound,
                      [] { WorkshopLoader("nowhere").load(); },
                      "Loader without a parent path should fail");

  std::filesystem::create_directories(tmp.path() / "nodefaults");
  write_file(tmp.path() / "nodefaults" / "LICENSE", "MIT");
  suite.require_error(ErrorKind::WorkshopDefaultsNotFound,
                      [&tmp] { WorkshopLoader("nodefaults").path(tmp.path()).load(); },
                      "Missing defaults.yaml should fail");

  WorkshopFixture unlicensed(tmp.path(), "unlicensed");
  std::filesystem::remove(unlicensed.root() / "LICENSE");
  suite.require_error(ErrorKind::WorkshopLicenseNotFound,
                      [&unlicensed] { load(unlicensed); }, "Missing LICENSE should fail");

  WorkshopFixture broken(tmp.path(), "broken");
  write_file(broken.root() / "defaults.yaml", "spoken_language: [unterminated\n");
  suite.require_error(ErrorKind::YamlParsing, [&broken] { load(broken); },
                      "Malformed defaults.yaml should fail to parse");

  WorkshopFixture unknown(tmp.path(), "unknown", "xx", "rs");
  suite.require_error(ErrorKind::InvalidLanguageCode, [&unknown] { load(unknown); },
                      "Unknown default language should be rejected");
}

void test_content_is_lazy_and_shared(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "lazy");
  fixture.add_spoken("en", "first version");
  fixture.add_programming("en", "rs", "setup");

  const auto data = load(fixture);
  write_file(fixture.root() / "en" / "description.md", "second version");
  suite.require(data.description(std::nullopt) == "second version",
                "Descriptions should be read on first access, not at load");

  const WorkshopData copy = data;
  write_file(fixture.root() / "en" / "description.md", "third version");
  suite.require(copy.description(std::nullopt) == "second version",
                "Copies should share the already loaded slot");

  std::filesystem::remove(fixture.root() / "en" / "rs" / "setup.md");
  suite.require_error(ErrorKind::Io,
                      [&data] { data.setup_instructions(std::nullopt, std::nullopt); },
                      "Missing setup.md should only fail when read");
}

void test_lessons_are_validated_on_access(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "lessons");
  fixture.add_spoken("en", "English");
  fixture.add_programming("en", "rs", "setup");
  fixture.add_lesson("en", "rs", "02-second");
  fixture.add_lesson("en", "rs", "01-first", "Completed");

  const auto data = load(fixture);
  const auto lessons = data.lessons(std::nullopt, std::nullopt);
  suite.require(lessons.size() == 2, "Two lessons should be listed");
  suite.require(lessons.begin()->first == "01-first", "Lessons should be ordered by name");
  suite.require(lessons.at("01-first").metadata().status == workshop::LessonStatus::Completed,
                "Lesson status should be read from lesson.yaml");
  suite.require(lessons.at("02-second").metadata().status == workshop::LessonStatus::NotStarted,
                "Missing status should read as NotStarted");
  suite.require(lessons.at("02-second").spoken_language() == spoken::Code::en &&
                    lessons.at("02-second").programming_language() == programming::Code::rs,
                "Lessons should carry the discovered language pair");

  TempDir tmp2;
  WorkshopFixture deferred(tmp2.path(), "deferred");
  deferred.add_spoken("en", "English");
  deferred.add_programming("en", "rs", "setup");
  const auto lesson_dir = deferred.add_lesson("en", "rs", "01-broken");
  std::filesystem::remove(lesson_dir / "lesson.md");

  const auto deferred_data = load(deferred);
  suite.require(deferred_data.name() == "deferred",
                "Discovery should not validate lesson directories");
  suite.require_error(ErrorKind::LessonTextFileMissing,
                      [&deferred_data] { deferred_data.lessons(std::nullopt, std::nullopt); },
                      "Missing lesson.md should fail on first access");
}

void test_paths(TestSuite& suite) {
  TempDir tmp;
  WorkshopFixture fixture(tmp.path(), "paths", "en", "rs");
  fixture.add_spoken("en", "English");

  const auto data = load(fixture);
  suite.require(data.path() == fixture.root(), "path() should be the workshop root");
  suite.require(data.parent_path() == tmp.path(), "parent_path() should be the data dir");
  suite.require(data.defaults().programming_language == programming::Code::rs,
                "Defaults should be read from defaults.yaml");
  suite.require(data.deps_script_path(std::nullopt, std::nullopt) ==
                    fixture.root() / "en" / "rs" / "deps.py",
                "Dependency script should default to the workshop defaults");
  suite.require(data.check_script_path("01-intro", spoken::Code::fr, programming::Code::py) ==
                    fixture.root() / "fr" / "py" / "01-intro" / "check.py",
                "Check script path should follow the requested pair");
  suite.require(data.lesson_dir_path("01-intro", std::nullopt, programming::Code::go) ==
                    fixture.root() / "en" / "go" / "01-intro",
                "Lesson dir path should mix request and default");
}

} // namespace

int main() {
  TestSuite suite;
  test_description_falls_back_to_default(suite);
  test_description_falls_back_to_only_member(suite);
  test_arbitrary_member_is_smallest_code(suite);
  test_empty_maps_are_errors(suite);
  test_two_level_fallback(suite);
  test_empty_inner_map(suite);
  test_is_selected(suite);
  test_skips_non_language_directories(suite);
  test_skips_mixed_case_directories(suite);
  test_structural_errors(suite);
  test_content_is_lazy_and_shared(suite);
  test_lessons_are_validated_on_access(suite);
  test_paths(suite);
  return suite.finish("Workshop loader");
}
