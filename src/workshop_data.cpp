#include "workshop/workshop_data.hpp"

#include "languages/languages.hpp"
#include "workshop/error.hpp"
#include "workshop/fs.hpp"
#include "workshop/log.hpp"
#include "yaml_bridge.hpp"

#include <algorithm>
#include <system_error>

namespace workshop {
namespace {

constexpr const char* kTag = "workshop";

// Picks the requested key, else the fallback, else the first key of the map.
// Returns nullopt only for an empty map.
template <typename Code, typename Map>
std::optional<Code> resolve_key(const Map& map, std::optional<Code> requested, Code fallback) {
  if (map.empty()) {
    return std::nullopt;
  }
  const Code candidate = requested.value_or(fallback);
  if (map.count(candidate) != 0) {
    return candidate;
  }
  return map.begin()->first;
}

template <typename Inner>
std::pair<spoken::Code, programming::Code> resolve_two_level(
    const std::map<spoken::Code, Inner>& outer,
    const Defaults& defaults,
    std::optional<spoken::Code> spoken,
    std::optional<programming::Code> programming,
    ErrorKind empty_kind,
    const std::string& workshop_name) {
  const auto spoken_key = resolve_key(outer, spoken, defaults.spoken_language);
  if (!spoken_key) {
    throw Error(empty_kind, workshop_name);
  }
  const auto& inner = outer.at(*spoken_key);
  const auto programming_key = resolve_key(inner, programming, defaults.programming_language);
  if (!programming_key) {
    throw Error(ErrorKind::WorkshopNoProgrammingLanguagesForSpokenLanguage,
                std::string(spoken::name_in_english(*spoken_key)));
  }
  return {*spoken_key, *programming_key};
}

std::string pair_label(spoken::Code spoken, programming::Code programming) {
  return spoken::to_string(spoken) + " + " + programming::to_string(programming);
}

} // namespace

WorkshopMetadata SlotLoader<WorkshopMetadata>::load(const std::filesystem::path& path) {
  return yaml_bridge::load_workshop_metadata(path);
}

std::vector<spoken::Code> WorkshopData::all_spoken_languages() const {
  std::vector<spoken::Code> out;
  out.reserve(languages_.size());
  for (const auto& [code, programming] : languages_) {
    (void)programming;
    out.push_back(code);
  }
  return out;
}

std::vector<programming::Code> WorkshopData::all_programming_languages() const {
  std::set<programming::Code> unique;
  for (const auto& [spoken, programming] : languages_) {
    (void)spoken;
    unique.insert(programming.begin(), programming.end());
  }
  return {unique.begin(), unique.end()};
}

std::vector<programming::Code> WorkshopData::programming_languages_for(spoken::Code spoken) const {
  const auto it = languages_.find(spoken);
  if (it == languages_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::vector<spoken::Code> WorkshopData::spoken_languages_for(programming::Code programming) const {
  std::vector<spoken::Code> out;
  for (const auto& [spoken, codes] : languages_) {
    if (codes.count(programming) != 0) {
      out.push_back(spoken);
    }
  }
  return out;
}

bool WorkshopData::is_selected(std::optional<spoken::Code> spoken,
                               std::optional<programming::Code> programming) const {
  log::debug(kTag, name_ + ": is_selected(" + spoken_name(spoken) + ", " +
                       programming_name(programming) + ")");
  if (spoken) {
    const auto it = languages_.find(*spoken);
    if (it == languages_.end()) {
      log::debug(kTag, "  not a supported spoken language");
      return false;
    }
    if (programming && it->second.count(*programming) == 0) {
      log::debug(kTag, "  not a supported programming language");
      return false;
    }
    return true;
  }
  if (programming) {
    const auto all = all_programming_languages();
    if (std::find(all.begin(), all.end(), *programming) == all.end()) {
      log::debug(kTag, "  not a supported programming language");
      return false;
    }
  }
  return true;
}

std::pair<spoken::Code, programming::Code> WorkshopData::resolve_languages(
    std::optional<spoken::Code> spoken,
    std::optional<programming::Code> programming) const {
  return resolve_two_level(setup_instructions_, defaults_, spoken, programming,
                           ErrorKind::WorkshopNoSetupInstructions, name_);
}

std::string WorkshopData::description(std::optional<spoken::Code> spoken) const {
  log::debug(kTag, name_ + ": description(" + spoken_name(spoken) + ")");
  const auto key = resolve_key(descriptions_, spoken, defaults_.spoken_language);
  if (!key) {
    throw Error(ErrorKind::WorkshopNoDescriptions, name_);
  }
  log::debug(kTag, name_ + ": description resolved to " + spoken::to_string(*key));
  return descriptions_.at(*key)->get();
}

std::string WorkshopData::setup_instructions(std::optional<spoken::Code> spoken,
                                             std::optional<programming::Code> programming) const {
  log::debug(kTag, name_ + ": setup_instructions(" + spoken_name(spoken) + ", " +
                       programming_name(programming) + ")");
  const auto [s, p] = resolve_two_level(setup_instructions_, defaults_, spoken, programming,
                                        ErrorKind::WorkshopNoSetupInstructions, name_);
  log::debug(kTag, name_ + ": setup_instructions resolved to " + pair_label(s, p));
  return setup_instructions_.at(s).at(p)->get();
}

WorkshopMetadata WorkshopData::metadata(std::optional<spoken::Code> spoken) const {
  log::debug(kTag, name_ + ": metadata(" + spoken_name(spoken) + ")");
  const auto key = resolve_key(metadata_, spoken, defaults_.spoken_language);
  if (!key) {
    throw Error(ErrorKind::WorkshopNoMetadata, name_);
  }
  log::debug(kTag, name_ + ": metadata resolved to " + spoken::to_string(*key));
  return metadata_.at(*key)->get();
}

std::string WorkshopData::license() const {
  log::debug(kTag, name_ + ": license()");
  return license_->get();
}

std::map<std::string, LessonEntry> WorkshopData::lessons(
    std::optional<spoken::Code> spoken,
    std::optional<programming::Code> programming) const {
  log::debug(kTag, name_ + ": lessons(" + spoken_name(spoken) + ", " +
                       programming_name(programming) + ")");
  const auto [s, p] = resolve_two_level(lessons_, defaults_, spoken, programming,
                                        ErrorKind::WorkshopNoLessonsData, name_);
  log::debug(kTag, name_ + ": lessons resolved to " + pair_label(s, p));

  std::map<std::string, LessonEntry> out;
  for (const auto& slot : lessons_.at(s).at(p)) {
    auto entry = slot->get();
    auto key = entry.name();
    out.emplace(std::move(key), std::move(entry));
  }
  return out;
}

std::filesystem::path WorkshopData::deps_script_path(
    std::optional<spoken::Code> spoken,
    std::optional<programming::Code> programming) const {
  const auto s = spoken.value_or(defaults_.spoken_language);
  const auto p = programming.value_or(defaults_.programming_language);
  return path_ / spoken::to_string(s) / programming::to_string(p) / "deps.py";
}

std::filesystem::path WorkshopData::lesson_dir_path(
    const std::string& lesson,
    std::optional<spoken::Code> spoken,
    std::optional<programming::Code> programming) const {
  const auto s = spoken.value_or(defaults_.spoken_language);
  const auto p = programming.value_or(defaults_.programming_language);
  return path_ / spoken::to_string(s) / programming::to_string(p) / lesson;
}

std::filesystem::path WorkshopData::check_script_path(
    const std::string& lesson,
    std::optional<spoken::Code> spoken,
    std::optional<programming::Code> programming) const {
  return lesson_dir_path(lesson, spoken, programming) / "check.py";
}

// ------------------------------------------------------------------

WorkshopLoader::WorkshopLoader(std::string name) : name_(std::move(name)) {}

WorkshopLoader& WorkshopLoader::path(const std::filesystem::path& parent) {
  parent_ = parent;
  return *this;
}

WorkshopData WorkshopLoader::load() const {
  if (!parent_) {
    throw Error(ErrorKind::WorkshopDataDirNotFound, name_);
  }

  WorkshopData data;
  data.name_ = name_;
  data.parent_path_ = *parent_;
  data.path_ = *parent_ / name_;

  if (!std::filesystem::is_directory(data.path_)) {
    throw Error(ErrorKind::WorkshopNotFound, name_);
  }

  const auto defaults_path = data.path_ / "defaults.yaml";
  if (!std::filesystem::exists(defaults_path)) {
    throw Error(ErrorKind::WorkshopDefaultsNotFound, name_);
  }
  data.defaults_ = yaml_bridge::load_defaults(defaults_path);

  discover_spoken(data);

  std::vector<spoken::Code> spoken_languages;
  spoken_languages.reserve(data.descriptions_.size());
  for (const auto& [code, slot] : data.descriptions_) {
    (void)slot;
    spoken_languages.push_back(code);
  }
  std::sort(spoken_languages.begin(), spoken_languages.end());

  discover_programming(data, spoken_languages);

  const auto license_path = data.path_ / "LICENSE";
  if (!std::filesystem::exists(license_path)) {
    throw Error(ErrorKind::WorkshopLicenseNotFound, name_);
  }
  data.license_ = make_slot<std::string>(license_path);

  for (const auto& [spoken, programming] : data.setup_instructions_) {
    auto& codes = data.languages_[spoken];
    for (const auto& [code, slot] : programming) {
      (void)slot;
      codes.insert(code);
    }
  }

  log::info(kTag, "loaded " + name_ + " with " + std::to_string(data.languages_.size()) +
                      " spoken language(s)");
  return data;
}

void WorkshopLoader::discover_spoken(WorkshopData& data) const {
  std::vector<std::filesystem::path> dirs;
  try {
    dirs = list_subdirectories(data.path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw Error(ErrorKind::WorkshopDataDirNotFound, e.what());
  }

  for (const auto& dir : dirs) {
    const auto dir_name = dir.filename().string();
    const auto code = spoken::from_code(dir_name);
    if (!code || spoken::to_string(*code) != dir_name) {
      continue;
    }
    log::debug(kTag, "found spoken language under " + data.path_.string() + ": " +
                         spoken::to_string(*code));
    data.descriptions_.emplace(*code, make_slot<std::string>(dir / "description.md"));
    data.metadata_.emplace(*code, make_slot<WorkshopMetadata>(dir / "workshop.yaml"));
  }
}

void WorkshopLoader::discover_programming(
    WorkshopData& data,
    const std::vector<spoken::Code>& spoken_languages) const {
  for (const auto spoken : spoken_languages) {
    const auto spoken_dir = data.path_ / spoken::to_string(spoken);
    std::vector<std::filesystem::path> programming_dirs;
    try {
      programming_dirs = list_subdirectories(spoken_dir);
    } catch (const std::filesystem::filesystem_error&) {
      throw Error(ErrorKind::WorkshopDataSpokenDirNotFound,
                  std::string(spoken::name_in_english(spoken)));
    }

    auto& setup = data.setup_instructions_[spoken];
    auto& lessons = data.lessons_[spoken];

    for (const auto& programming_dir : programming_dirs) {
      const auto dir_name = programming_dir.filename().string();
      const auto programming = programming::from_code(dir_name);
      if (!programming || programming::to_string(*programming) != dir_name) {
        continue;
      }
      log::debug(kTag, "found setup instructions under " + data.path_.string() + ": " +
                           pair_label(spoken, *programming));
      setup.emplace(*programming, make_slot<std::string>(programming_dir / "setup.md"));

      std::vector<std::filesystem::path> lesson_dirs;
      try {
        lesson_dirs = list_subdirectories(programming_dir);
      } catch (const std::filesystem::filesystem_error&) {
        throw Error(ErrorKind::WorkshopDataProgrammingDirNotFound,
                    std::string(programming::display_name(*programming)));
      }

      auto& slots = lessons[*programming];
      for (const auto& lesson_dir : lesson_dirs) {
        log::debug(kTag, "found lesson under " + pair_label(spoken, *programming) + ": " +
                             lesson_dir.filename().string());
        const auto p = *programming;
        slots.push_back(make_slot<LessonEntry>(
            lesson_dir, [spoken, p](const std::filesystem::path& path) {
              return LessonLoader(path.filename().string())
                  .path(path)
                  .spoken_language(spoken)
                  .programming_language(p)
                  .load();
            }));
      }
    }
  }
}

} // namespace workshop
