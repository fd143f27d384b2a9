#include "workshop/workshops.hpp"

#include "command/command_runner.hpp"
#include "workshop/error.hpp"
#include "workshop/fs.hpp"
#include "workshop/log.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <set>
#include <sstream>
#include <system_error>

namespace workshop {
namespace workshops {
namespace {

constexpr const char* kTag = "workshops";
constexpr const char* kDataDirName = ".workshops";

void copy_tree(const std::filesystem::path& source, const std::filesystem::path& target) {
  if (!std::filesystem::is_directory(source)) {
    throw Error(ErrorKind::WorkshopDataDirNotFound, source.string());
  }
  std::error_code ec;
  std::filesystem::create_directories(target, ec);
  if (ec) {
    throw Error(ErrorKind::Io, target.string() + ": " + ec.message());
  }
  std::filesystem::copy(source, target,
                        std::filesystem::copy_options::recursive |
                            std::filesystem::copy_options::overwrite_existing,
                        ec);
  if (ec) {
    throw Error(ErrorKind::Io, "copy " + source.string() + " -> " + target.string() + ": " +
                                   ec.message());
  }
}

} // namespace

std::vector<WorkshopData> load_all(const std::filesystem::path& data_dir) {
  if (!std::filesystem::is_directory(data_dir)) {
    throw Error(ErrorKind::WorkshopDataDirNotFound, data_dir.string());
  }

  std::vector<std::filesystem::path> dirs;
  try {
    dirs = list_subdirectories(data_dir);
  } catch (const std::filesystem::filesystem_error& e) {
    throw Error(ErrorKind::WorkshopDataDirNotFound, e.what());
  }

  std::vector<WorkshopData> out;
  out.reserve(dirs.size());
  for (const auto& dir : dirs) {
    const auto name = dir.filename().string();
    log::info(kTag, "... " + name);
    out.push_back(WorkshopLoader(name).path(data_dir).load());
  }
  return out;
}

std::vector<WorkshopData> load_all_filtered(const std::filesystem::path& data_dir,
                                            std::optional<spoken::Code> spoken,
                                            std::optional<programming::Code> programming) {
  auto all = load_all(data_dir);
  std::vector<WorkshopData> out;
  for (auto& workshop : all) {
    if (workshop.is_selected(spoken, programming)) {
      out.push_back(std::move(workshop));
    }
  }
  return out;
}

std::optional<WorkshopData> load(const std::filesystem::path& data_dir, const std::string& name) {
  if (!std::filesystem::is_directory(data_dir / name)) {
    return std::nullopt;
  }
  try {
    return WorkshopLoader(name).path(data_dir).load();
  } catch (const Error& e) {
    log::error(kTag, name + ": " + e.what());
    return std::nullopt;
  }
}

std::vector<spoken::Code> all_spoken_languages(const std::vector<WorkshopData>& workshops) {
  std::set<spoken::Code> unique;
  for (const auto& workshop : workshops) {
    for (const auto code : workshop.all_spoken_languages()) {
      unique.insert(code);
    }
  }
  return {unique.begin(), unique.end()};
}

std::vector<programming::Code> all_programming_languages(const std::vector<WorkshopData>& workshops) {
  std::set<programming::Code> unique;
  for (const auto& workshop : workshops) {
    for (const auto code : workshop.all_programming_languages()) {
      unique.insert(code);
    }
  }
  return {unique.begin(), unique.end()};
}

WorkshopData::LanguagesMap all_languages(const std::vector<WorkshopData>& workshops) {
  WorkshopData::LanguagesMap out;
  for (const auto& workshop : workshops) {
    for (const auto& [spoken, codes] : workshop.languages()) {
      out[spoken].insert(codes.begin(), codes.end());
    }
  }
  return out;
}

std::optional<std::filesystem::path> find_data_dir(const std::filesystem::path& start) {
  std::error_code ec;
  auto current = std::filesystem::absolute(start, ec);
  if (ec) {
    current = start;
  }
  for (;;) {
    const auto candidate = current / kDataDirName;
    if (std::filesystem::is_directory(candidate, ec)) {
      log::debug(kTag, "found data dir " + candidate.string());
      return candidate;
    }
    const auto parent = current.parent_path();
    if (parent.empty() || parent == current) {
      return std::nullopt;
    }
    current = parent;
  }
}

std::filesystem::path init_data_dir(const std::string& name,
                                    const std::filesystem::path& source_dir,
                                    const std::filesystem::path& cwd) {
  const auto source = source_dir / name;
  if (!std::filesystem::is_directory(source)) {
    throw Error(ErrorKind::WorkshopDataDirNotFound, source.string());
  }

  const auto data_dir = cwd / kDataDirName;
  const auto target = data_dir / name;
  log::info(kTag, "copying " + source.string() + " to " + target.string());
  copy_tree(source, target);
  return data_dir;
}

} // namespace workshops

namespace application {
namespace {

constexpr const char* kTag = "application";
constexpr const char* kApplicationName = "workshop";

std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

std::filesystem::path xdg_dir(const char* variable, const char* home_suffix) {
  std::filesystem::path base;
  const auto xdg = env_or_empty(variable);
  if (!xdg.empty()) {
    base = xdg;
  } else {
    const auto home = env_or_empty("HOME");
    if (home.empty()) {
      throw Error(ErrorKind::ApplicationDirsNotFound, variable);
    }
    base = std::filesystem::path(home) / home_suffix;
  }

  const auto dir = base / kApplicationName;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error(ErrorKind::Io, dir.string() + ": " + ec.message());
  }
  return dir;
}

std::string expand_tilde(const std::string& candidate) {
  if (candidate.rfind("~/", 0) != 0) {
    return candidate;
  }
  const auto home = env_or_empty("HOME");
  if (home.empty()) {
    return candidate;
  }
  return home + candidate.substr(1);
}

std::string version_string(const PythonVersion& version) {
  return std::to_string(version.major) + "." + std::to_string(version.minor) + "." +
         std::to_string(version.patch);
}

} // namespace

std::filesystem::path data_dir() { return xdg_dir("XDG_DATA_HOME", ".local/share"); }

std::filesystem::path config_dir() { return xdg_dir("XDG_CONFIG_HOME", ".config"); }

bool operator<(const PythonVersion& lhs, const PythonVersion& rhs) {
  if (lhs.major != rhs.major) {
    return lhs.major < rhs.major;
  }
  if (lhs.minor != rhs.minor) {
    return lhs.minor < rhs.minor;
  }
  return lhs.patch < rhs.patch;
}

std::optional<PythonVersion> parse_python_version(const std::string& text) {
  std::istringstream stream(text);
  std::string word;
  std::string number;
  while (stream >> word) {
    if (word == "Python") {
      stream >> number;
      break;
    }
    if (!word.empty() && std::all_of(word.begin(), word.end(), [](char c) {
          return (c >= '0' && c <= '9') || c == '.';
        })) {
      number = word;
      break;
    }
  }
  if (number.empty()) {
    return std::nullopt;
  }

  PythonVersion version;
  int* parts[] = {&version.major, &version.minor, &version.patch};
  std::size_t index = 0;
  std::size_t pos = 0;
  while (pos <= number.size() && index < 3) {
    const auto dot = number.find('.', pos);
    const auto piece = number.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
    // Longer runs would overflow std::stoi.
    if (piece.empty() || piece.size() > 6 ||
        !std::all_of(piece.begin(), piece.end(), [](char c) { return c >= '0' && c <= '9'; })) {
      break;
    }
    *parts[index++] = std::stoi(piece);
    if (dot == std::string::npos) {
      break;
    }
    pos = dot + 1;
  }
  if (index < 2) {
    return std::nullopt;
  }
  return version;
}

std::string find_python_executable(const PythonVersion& min_version) {
  const std::vector<std::string> candidates = {
      "python3",
      "python",
      "/usr/bin/python3",
      "/usr/local/bin/python3",
      "/bin/python3",
      "~/.pyenv/shims/python3",
  };

  const std::atomic<bool> cancel{false};
  for (const auto& raw : candidates) {
    const auto candidate = expand_tilde(raw);
    log::debug(kTag, "checking python candidate " + candidate);

    std::string output;
    command::CommandRunner runner([&output](const std::string& line) {
      if (line.rfind("Running: ", 0) != 0) {
        output += line;
        output += '\n';
      }
    });

    try {
      const auto result = runner.run(candidate, {"--version"}, std::nullopt, cancel);
      if (!result.success) {
        continue;
      }
    } catch (const Error& e) {
      log::debug(kTag, candidate + ": " + e.what());
      continue;
    }

    const auto version = parse_python_version(output);
    if (!version) {
      log::debug(kTag, candidate + " did not report a python version");
      continue;
    }
    if (!(*version < min_version)) {
      log::info(kTag, "found python " + candidate + " (" + version_string(*version) + ")");
      return candidate;
    }
  }

  throw Error(ErrorKind::NoPythonExecutable, "need at least " + version_string(min_version));
}

} // namespace application
} // namespace workshop
