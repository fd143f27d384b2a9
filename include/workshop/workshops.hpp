#pragma once

#include "languages/programming.hpp"
#include "languages/spoken.hpp"
#include "workshop_data.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workshop::workshops {

// One store per subdirectory of data_dir, in directory-name order. The first
// workshop that fails to load fails the call.
std::vector<WorkshopData> load_all(const std::filesystem::path& data_dir);

// load_all restricted to workshops that offer the requested languages.
std::vector<WorkshopData> load_all_filtered(const std::filesystem::path& data_dir,
                                            std::optional<spoken::Code> spoken,
                                            std::optional<programming::Code> programming);

// nullopt when {data_dir}/{name} is absent or does not load.
std::optional<WorkshopData> load(const std::filesystem::path& data_dir, const std::string& name);

std::vector<spoken::Code> all_spoken_languages(const std::vector<WorkshopData>& workshops);
std::vector<programming::Code> all_programming_languages(const std::vector<WorkshopData>& workshops);
WorkshopData::LanguagesMap all_languages(const std::vector<WorkshopData>& workshops);

// Walks from start towards the root looking for a ".workshops" directory.
std::optional<std::filesystem::path> find_data_dir(const std::filesystem::path& start);

// Copies {source_dir}/{name} into {cwd}/.workshops/{name} and returns the
// data directory.
std::filesystem::path init_data_dir(const std::string& name,
                                    const std::filesystem::path& source_dir,
                                    const std::filesystem::path& cwd);

} // namespace workshop::workshops

namespace workshop::application {

// $XDG_DATA_HOME/workshop, else ~/.local/share/workshop. Created on demand.
std::filesystem::path data_dir();
// $XDG_CONFIG_HOME/workshop, else ~/.config/workshop. Created on demand.
std::filesystem::path config_dir();

struct PythonVersion {
  int major = 0;
  int minor = 0;
  int patch = 0;
};

bool operator<(const PythonVersion& lhs, const PythonVersion& rhs);

// Parses "Python 3.11.4" (patch optional).
std::optional<PythonVersion> parse_python_version(const std::string& text);

// First candidate interpreter whose --version is at least min_version.
// Throws Error(NoPythonExecutable) when none qualifies.
std::string find_python_executable(const PythonVersion& min_version);

} // namespace workshop::application
