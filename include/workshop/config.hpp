#pragma once

#include "languages/programming.hpp"
#include "languages/spoken.hpp"

#include <filesystem>
#include <optional>

namespace workshop {

// User preferences persisted in {config_dir}/config.json.
struct Config {
  std::optional<spoken::Code> spoken_language;
  std::optional<programming::Code> programming_language;

  // Reads path, or writes and returns an empty Config when it does not exist.
  // Throws Error(JsonParsing) or Error(InvalidLanguageCode) on bad content.
  static Config load(const std::filesystem::path& path);
  void save(const std::filesystem::path& path) const;
};

} // namespace workshop
