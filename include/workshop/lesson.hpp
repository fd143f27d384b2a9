#pragma once

#include "languages/programming.hpp"
#include "languages/spoken.hpp"
#include "lazy_slot.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace workshop {

template <>
struct SlotLoader<LessonMetadata> {
  static LessonMetadata load(const std::filesystem::path& path);
};

class LessonEntry {
public:
  const std::string& name() const { return name_; }
  const std::filesystem::path& path() const { return path_; }
  spoken::Code spoken_language() const { return spoken_language_; }
  programming::Code programming_language() const { return programming_language_; }

  std::string text() const;
  LessonMetadata metadata() const;

  // Rewrites lesson.yaml with the new status and updates the cached metadata
  // in place. Returns the updated metadata.
  LessonMetadata update_status(LessonStatus status);

  bool text_loaded() const { return text_->is_loaded(); }
  bool metadata_loaded() const { return metadata_->is_loaded(); }

private:
  friend class LessonLoader;

  LessonEntry(std::string name,
              std::filesystem::path path,
              spoken::Code spoken_language,
              programming::Code programming_language,
              SharedSlot<std::string> text,
              SharedSlot<LessonMetadata> metadata);

  std::string name_;
  std::filesystem::path path_;
  spoken::Code spoken_language_;
  programming::Code programming_language_;
  SharedSlot<std::string> text_;
  SharedSlot<LessonMetadata> metadata_;
};

// Requires lesson.md and lesson.yaml up front.
class LessonLoader {
public:
  explicit LessonLoader(std::string name);

  LessonLoader& path(const std::filesystem::path& path);
  LessonLoader& spoken_language(spoken::Code code);
  LessonLoader& programming_language(programming::Code code);

  LessonEntry load() const;

private:
  std::string name_;
  std::optional<std::filesystem::path> path_;
  std::optional<spoken::Code> spoken_language_;
  std::optional<programming::Code> programming_language_;
};

// Derives the language pair from ".../{spoken}/{programming}/{lesson}" and
// loads the lesson.
LessonEntry load_lesson_from_path(const std::filesystem::path& lesson_dir);

} // namespace workshop
