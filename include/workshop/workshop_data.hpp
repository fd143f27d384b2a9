#pragma once

#include "languages/programming.hpp"
#include "languages/spoken.hpp"
#include "lazy_slot.hpp"
#include "lesson.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace workshop {

template <>
struct SlotLoader<WorkshopMetadata> {
  static WorkshopMetadata load(const std::filesystem::path& path);
};

// Accessors resolve: request, then workshop default, then smallest code.
class WorkshopData {
public:
  using DescriptionsMap = std::map<spoken::Code, SharedSlot<std::string>>;
  using SetupInstructionsMap =
      std::map<spoken::Code, std::map<programming::Code, SharedSlot<std::string>>>;
  using MetadataMap = std::map<spoken::Code, SharedSlot<WorkshopMetadata>>;
  using LessonSlots = std::vector<SharedSlot<LessonEntry>>;
  using LessonsMap = std::map<spoken::Code, std::map<programming::Code, LessonSlots>>;
  using LanguagesMap = std::map<spoken::Code, std::set<programming::Code>>;

  const std::string& name() const { return name_; }
  // Workshop root, i.e. {parent}/{name}.
  const std::filesystem::path& path() const { return path_; }
  const std::filesystem::path& parent_path() const { return parent_path_; }
  const Defaults& defaults() const { return defaults_; }

  std::vector<spoken::Code> all_spoken_languages() const;
  std::vector<programming::Code> all_programming_languages() const;
  const LanguagesMap& languages() const { return languages_; }
  std::vector<programming::Code> programming_languages_for(spoken::Code spoken) const;
  std::vector<spoken::Code> spoken_languages_for(programming::Code programming) const;

  bool is_selected(std::optional<spoken::Code> spoken,
                   std::optional<programming::Code> programming) const;

  std::pair<spoken::Code, programming::Code> resolve_languages(
      std::optional<spoken::Code> spoken,
      std::optional<programming::Code> programming) const;

  std::string description(std::optional<spoken::Code> spoken) const;
  std::string setup_instructions(std::optional<spoken::Code> spoken,
                                 std::optional<programming::Code> programming) const;
  WorkshopMetadata metadata(std::optional<spoken::Code> spoken) const;
  std::string license() const;
  std::map<std::string, LessonEntry> lessons(std::optional<spoken::Code> spoken,
                                             std::optional<programming::Code> programming) const;

  // Paths handed to the checker; absent languages fall back to the defaults.
  std::filesystem::path deps_script_path(std::optional<spoken::Code> spoken,
                                         std::optional<programming::Code> programming) const;
  std::filesystem::path lesson_dir_path(const std::string& lesson,
                                        std::optional<spoken::Code> spoken,
                                        std::optional<programming::Code> programming) const;
  std::filesystem::path check_script_path(const std::string& lesson,
                                          std::optional<spoken::Code> spoken,
                                          std::optional<programming::Code> programming) const;

private:
  friend class WorkshopLoader;

  WorkshopData() = default;

  std::string name_;
  std::filesystem::path parent_path_;
  std::filesystem::path path_;
  Defaults defaults_;
  DescriptionsMap descriptions_;
  SetupInstructionsMap setup_instructions_;
  MetadataMap metadata_;
  LessonsMap lessons_;
  SharedSlot<std::string> license_;
  LanguagesMap languages_;
};

class WorkshopLoader {
public:
  explicit WorkshopLoader(std::string name);

  WorkshopLoader& path(const std::filesystem::path& parent);

  WorkshopData load() const;

private:
  void discover_spoken(WorkshopData& data) const;
  void discover_programming(WorkshopData& data,
                            const std::vector<spoken::Code>& spoken_languages) const;

  std::string name_;
  std::optional<std::filesystem::path> parent_;
};

} // namespace workshop
