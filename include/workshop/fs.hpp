#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace workshop {

// Throws Error(Io) when the file cannot be opened or read.
std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& content);

// Immediate subdirectories of dir, sorted by path. Throws std::filesystem_error
// when dir cannot be iterated.
std::vector<std::filesystem::path> list_subdirectories(const std::filesystem::path& dir);

} // namespace workshop
