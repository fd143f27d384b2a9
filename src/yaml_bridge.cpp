#include "yaml_bridge.hpp"

#include "../include/workshop/error.hpp"
#include "../include/workshop/fs.hpp"

#include <yaml-cpp/yaml.h>

namespace workshop::yaml_bridge {
namespace {

[[noreturn]] void fail(const std::filesystem::path& source, const std::string& message) {
  throw Error(ErrorKind::YamlParsing, source.string() + ": " + message);
}

YAML::Node parse_document(const std::string& text, const std::filesystem::path& source) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    fail(source, e.what());
  }
  if (!root.IsMap()) {
    fail(source, "expected a mapping at document root");
  }
  return root;
}

std::string required_string(const YAML::Node& root, const char* key,
                            const std::filesystem::path& source) {
  const YAML::Node node = root[key];
  if (!node.IsDefined() || node.IsNull()) {
    fail(source, std::string("missing field `") + key + "`");
  }
  if (!node.IsScalar()) {
    fail(source, std::string("field `") + key + "` must be a string");
  }
  return node.as<std::string>();
}

std::vector<std::string> required_strings(const YAML::Node& root, const char* key,
                                          const std::filesystem::path& source) {
  const YAML::Node node = root[key];
  if (!node.IsDefined() || node.IsNull()) {
    fail(source, std::string("missing field `") + key + "`");
  }
  if (!node.IsSequence()) {
    fail(source, std::string("field `") + key + "` must be a sequence");
  }
  std::vector<std::string> out;
  out.reserve(node.size());
  for (const auto& item : node) {
    if (!item.IsScalar()) {
      fail(source, std::string("field `") + key + "` must contain strings");
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

} // namespace

Defaults defaults_from_yaml(const std::string& text, const std::filesystem::path& source) {
  const auto root = parse_document(text, source);
  Defaults defaults;
  defaults.spoken_language = spoken::parse(required_string(root, "spoken_language", source));
  defaults.programming_language =
      programming::parse(required_string(root, "programming_language", source));
  return defaults;
}

WorkshopMetadata workshop_metadata_from_yaml(const std::string& text,
                                             const std::filesystem::path& source) {
  const auto root = parse_document(text, source);
  WorkshopMetadata metadata;
  metadata.title = required_string(root, "title", source);
  metadata.authors = required_strings(root, "authors", source);
  metadata.copyright = required_string(root, "copyright", source);
  metadata.license = required_string(root, "license", source);
  metadata.homepage = required_string(root, "homepage", source);
  metadata.difficulty = required_string(root, "difficulty", source);
  return metadata;
}

LessonMetadata lesson_metadata_from_yaml(const std::string& text,
                                         const std::filesystem::path& source) {
  const auto root = parse_document(text, source);
  LessonMetadata metadata;
  metadata.title = required_string(root, "title", source);
  metadata.description = required_string(root, "description", source);
  const YAML::Node status = root["status"];
  if (status.IsDefined() && !status.IsNull()) {
    if (!status.IsScalar()) {
      fail(source, "field `status` must be a string");
    }
    const auto value = status.as<std::string>();
    const auto parsed = lesson_status_from_string(value);
    if (!parsed) {
      fail(source, "unknown lesson status `" + value + "`");
    }
    metadata.status = *parsed;
  }
  return metadata;
}

std::string to_yaml(const LessonMetadata& metadata) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "title" << YAML::Value << metadata.title;
  out << YAML::Key << "description" << YAML::Value << metadata.description;
  out << YAML::Key << "status" << YAML::Value << std::string(to_string(metadata.status));
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

Defaults load_defaults(const std::filesystem::path& path) {
  return defaults_from_yaml(read_text_file(path), path);
}

WorkshopMetadata load_workshop_metadata(const std::filesystem::path& path) {
  return workshop_metadata_from_yaml(read_text_file(path), path);
}

LessonMetadata load_lesson_metadata(const std::filesystem::path& path) {
  return lesson_metadata_from_yaml(read_text_file(path), path);
}

} // namespace workshop::yaml_bridge
