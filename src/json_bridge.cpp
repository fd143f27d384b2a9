#include "json_bridge.hpp"

#include "../include/workshop/error.hpp"
#include "../include/workshop/fs.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace workshop::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw Error(ErrorKind::JsonParsing,
                "expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw Error(ErrorKind::JsonParsing, "expected object for " + std::string(what));
  }
}

template <typename T, typename ToString>
nlohmann::json optional_to_json(const std::optional<T>& value, ToString&& to_string) {
  if (!value) {
    return nullptr;
  }
  return to_string(*value);
}

} // namespace

nlohmann::json to_json(const Config& config) {
  nlohmann::json out = nlohmann::json::object();
  out["spoken_language"] = optional_to_json(
      config.spoken_language, [](spoken::Code code) { return spoken::to_string(code); });
  out["programming_language"] =
      optional_to_json(config.programming_language,
                       [](programming::Code code) { return programming::to_string(code); });
  return out;
}

Config config_from_json(const nlohmann::json& json_config) {
  require_object(json_config, "config");
  Config config;
  assign_if_present(json_config, "spoken_language", [&](const nlohmann::json& value) {
    config.spoken_language = spoken::parse(json_to_string(value, "spoken_language"));
  });
  assign_if_present(json_config, "programming_language", [&](const nlohmann::json& value) {
    config.programming_language =
        programming::parse(json_to_string(value, "programming_language"));
  });
  return config;
}

nlohmann::json to_json(const StatusRecord& record) {
  nlohmann::json out = nlohmann::json::object();
  out["spoken_language"] = optional_to_json(
      record.spoken_language, [](spoken::Code code) { return spoken::to_string(code); });
  out["programming_language"] =
      optional_to_json(record.programming_language,
                       [](programming::Code code) { return programming::to_string(code); });
  out["workshop"] = optional_to_json(record.workshop, [](const std::string& s) { return s; });
  out["lesson"] = optional_to_json(record.lesson, [](const std::string& s) { return s; });
  return out;
}

StatusRecord status_record_from_json(const nlohmann::json& json_record) {
  require_object(json_record, "status");
  StatusRecord record;
  assign_if_present(json_record, "spoken_language", [&](const nlohmann::json& value) {
    record.spoken_language = spoken::parse(json_to_string(value, "spoken_language"));
  });
  assign_if_present(json_record, "programming_language", [&](const nlohmann::json& value) {
    record.programming_language =
        programming::parse(json_to_string(value, "programming_language"));
  });
  assign_if_present(json_record, "workshop", [&](const nlohmann::json& value) {
    record.workshop = json_to_string(value, "workshop");
  });
  assign_if_present(json_record, "lesson", [&](const nlohmann::json& value) {
    record.lesson = json_to_string(value, "lesson");
  });
  return record;
}

nlohmann::json load_json_file(const std::filesystem::path& path) {
  const auto text = read_text_file(path);
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw Error(ErrorKind::JsonParsing, path.string() + ": " + e.what());
  }
}

void save_json_file(const std::filesystem::path& path, const nlohmann::json& value) {
  write_text_file(path, value.dump(2) + "\n");
}

} // namespace workshop::bridge
