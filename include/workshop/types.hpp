#pragma once

#include "languages/programming.hpp"
#include "languages/spoken.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workshop {

// Fallback language pair of a workshop, read from defaults.yaml.
struct Defaults {
  spoken::Code spoken_language = spoken::kDefault;
  programming::Code programming_language = programming::kDefault;
};

// Contents of {spoken}/workshop.yaml.
struct WorkshopMetadata {
  std::string title;
  std::vector<std::string> authors;
  std::string copyright;
  std::string license;
  std::string homepage;
  std::string difficulty;
};

enum class LessonStatus { NotStarted, InProgress, Completed };

// "Not Started", "In Progress", "Completed".
std::string_view display_name(LessonStatus status);
// The spelling used in lesson.yaml: "NotStarted", "InProgress", "Completed".
std::string_view to_string(LessonStatus status);
std::optional<LessonStatus> lesson_status_from_string(std::string_view value);

// Contents of lesson.yaml.
struct LessonMetadata {
  std::string title;
  std::string description;
  LessonStatus status = LessonStatus::NotStarted;
};

} // namespace workshop
