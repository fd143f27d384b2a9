#pragma once

#include "config.hpp"
#include "languages/programming.hpp"
#include "languages/spoken.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace workshop {

// The persisted part of Status.
struct StatusRecord {
  std::optional<spoken::Code> spoken_language;
  std::optional<programming::Code> programming_language;
  std::optional<std::string> workshop;
  std::optional<std::string> lesson;
};

class Status {
public:
  static Status load(const std::filesystem::path& status_path,
                     const std::filesystem::path& config_path);

  void save() const;

  std::optional<spoken::Code> spoken_language() const { return record_.spoken_language; }
  std::optional<programming::Code> programming_language() const {
    return record_.programming_language;
  }
  const std::optional<std::string>& workshop() const { return record_.workshop; }
  const std::optional<std::string>& lesson() const { return record_.lesson; }
  const Config& config() const { return config_; }

  // make_default also records the choice in the Config.
  void set_spoken_language(std::optional<spoken::Code> code, bool make_default);
  void set_programming_language(std::optional<programming::Code> code, bool make_default);
  void set_workshop(std::optional<std::string> workshop);
  void set_lesson(std::optional<std::string> lesson);

private:
  Status(std::filesystem::path status_path, std::filesystem::path config_path, Config config);

  std::filesystem::path status_path_;
  std::filesystem::path config_path_;
  Config config_;
  StatusRecord record_;
};

} // namespace workshop
