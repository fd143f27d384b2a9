#pragma once

#include "../include/workshop/types.hpp"

#include <filesystem>
#include <string>

namespace workshop::yaml_bridge {

// Each reader throws Error(YamlParsing) for malformed documents, naming the
// source path, and Error(InvalidLanguageCode) for unknown language codes.
Defaults defaults_from_yaml(const std::string& text, const std::filesystem::path& source);
WorkshopMetadata workshop_metadata_from_yaml(const std::string& text,
                                             const std::filesystem::path& source);
LessonMetadata lesson_metadata_from_yaml(const std::string& text,
                                         const std::filesystem::path& source);

std::string to_yaml(const LessonMetadata& metadata);

Defaults load_defaults(const std::filesystem::path& path);
WorkshopMetadata load_workshop_metadata(const std::filesystem::path& path);
LessonMetadata load_lesson_metadata(const std::filesystem::path& path);

} // namespace workshop::yaml_bridge
