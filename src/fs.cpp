#include "workshop/fs.hpp"

#include "workshop/error.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace workshop {

std::string read_text_file(const std::filesystem::path& path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw Error(ErrorKind::Io, "failed to open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw Error(ErrorKind::Io, "failed to read " + path.string());
  }
  return content;
}

void write_text_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream stream(path, std::ios::binary | std::ios::trunc);
  if (!stream) {
    throw Error(ErrorKind::Io, "failed to open " + path.string() + " for writing");
  }
  stream << content;
  stream.flush();
  if (!stream) {
    throw Error(ErrorKind::Io, "failed to write " + path.string());
  }
}

std::vector<std::filesystem::path> list_subdirectories(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> out;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    std::error_code ec;
    if (entry.is_directory(ec)) {
      out.push_back(entry.path());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace workshop
