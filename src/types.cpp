#include "workshop/types.hpp"

namespace workshop {

std::string_view display_name(LessonStatus status) {
  switch (status) {
    case LessonStatus::NotStarted:
      return "Not Started";
    case LessonStatus::InProgress:
      return "In Progress";
    case LessonStatus::Completed:
      return "Completed";
  }
  return "Not Started";
}

std::string_view to_string(LessonStatus status) {
  switch (status) {
    case LessonStatus::NotStarted:
      return "NotStarted";
    case LessonStatus::InProgress:
      return "InProgress";
    case LessonStatus::Completed:
      return "Completed";
  }
  return "NotStarted";
}

std::optional<LessonStatus> lesson_status_from_string(std::string_view value) {
  if (value == "NotStarted") {
    return LessonStatus::NotStarted;
  }
  if (value == "InProgress") {
    return LessonStatus::InProgress;
  }
  if (value == "Completed") {
    return LessonStatus::Completed;
  }
  return std::nullopt;
}

} // namespace workshop
