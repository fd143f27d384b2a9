#include "workshop/lesson.hpp"

#include "workshop/error.hpp"
#include "workshop/fs.hpp"
#include "workshop/log.hpp"
#include "yaml_bridge.hpp"

#include <utility>

namespace workshop {
namespace {

constexpr const char* kLessonText = "lesson.md";
constexpr const char* kLessonMetadata = "lesson.yaml";

} // namespace

LessonMetadata SlotLoader<LessonMetadata>::load(const std::filesystem::path& path) {
  return yaml_bridge::load_lesson_metadata(path);
}

LessonEntry::LessonEntry(std::string name,
                         std::filesystem::path path,
                         spoken::Code spoken_language,
                         programming::Code programming_language,
                         SharedSlot<std::string> text,
                         SharedSlot<LessonMetadata> metadata)
    : name_(std::move(name)),
      path_(std::move(path)),
      spoken_language_(spoken_language),
      programming_language_(programming_language),
      text_(std::move(text)),
      metadata_(std::move(metadata)) {}

std::string LessonEntry::text() const { return text_->get(); }

LessonMetadata LessonEntry::metadata() const { return metadata_->get(); }

LessonMetadata LessonEntry::update_status(LessonStatus status) {
  log::info("lesson", name_ + ": status -> " + std::string(display_name(status)));
  return metadata_->with([this, status](LessonMetadata& current) {
    LessonMetadata updated = current;
    updated.status = status;
    write_text_file(metadata_->source(), yaml_bridge::to_yaml(updated));
    current = updated;
    return updated;
  });
}

LessonLoader::LessonLoader(std::string name) : name_(std::move(name)) {}

LessonLoader& LessonLoader::path(const std::filesystem::path& path) {
  path_ = path;
  return *this;
}

LessonLoader& LessonLoader::spoken_language(spoken::Code code) {
  spoken_language_ = code;
  return *this;
}

LessonLoader& LessonLoader::programming_language(programming::Code code) {
  programming_language_ = code;
  return *this;
}

LessonEntry LessonLoader::load() const {
  if (!path_ || !std::filesystem::is_directory(*path_)) {
    throw Error(ErrorKind::LessonDataDirNotFound, path_ ? path_->string() : name_);
  }
  if (!spoken_language_) {
    throw Error(ErrorKind::NoSpokenLanguageSpecified, name_);
  }
  if (!programming_language_) {
    throw Error(ErrorKind::NoProgrammingLanguageSpecified, name_);
  }

  const auto text_path = *path_ / kLessonText;
  if (!std::filesystem::exists(text_path)) {
    throw Error(ErrorKind::LessonTextFileMissing, text_path.string());
  }
  const auto metadata_path = *path_ / kLessonMetadata;
  if (!std::filesystem::exists(metadata_path)) {
    throw Error(ErrorKind::LessonMetadataFileMissing, metadata_path.string());
  }

  return LessonEntry(name_, *path_, *spoken_language_, *programming_language_,
                     make_slot<std::string>(text_path),
                     make_slot<LessonMetadata>(metadata_path));
}

LessonEntry load_lesson_from_path(const std::filesystem::path& lesson_dir) {
  auto dir = lesson_dir;
  if (!dir.has_filename()) {
    dir = dir.parent_path();
  }
  const auto name = dir.filename().string();
  if (name.empty()) {
    throw Error(ErrorKind::LessonDataDirNotFound, lesson_dir.string());
  }

  const auto programming_dir = dir.parent_path();
  const auto programming_code = programming_dir.has_filename()
                                    ? programming::from_code(programming_dir.filename().string())
                                    : std::nullopt;
  if (!programming_code) {
    throw Error(ErrorKind::NoProgrammingLanguageSpecified, lesson_dir.string());
  }

  const auto spoken_dir = programming_dir.parent_path();
  const auto spoken_code = spoken_dir.has_filename()
                               ? spoken::from_code(spoken_dir.filename().string())
                               : std::nullopt;
  if (!spoken_code) {
    throw Error(ErrorKind::NoSpokenLanguageSpecified, lesson_dir.string());
  }

  return LessonLoader(name)
      .path(dir)
      .spoken_language(*spoken_code)
      .programming_language(*programming_code)
      .load();
}

} // namespace workshop
