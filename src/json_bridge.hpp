#pragma once

#include "../include/workshop/config.hpp"
#include "../include/workshop/status.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace workshop::bridge {

nlohmann::json to_json(const Config& config);
Config config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const StatusRecord& record);
StatusRecord status_record_from_json(const nlohmann::json& json_record);

// Reads and parses path; throws Error(JsonParsing) naming the path.
nlohmann::json load_json_file(const std::filesystem::path& path);
void save_json_file(const std::filesystem::path& path, const nlohmann::json& value);

} // namespace workshop::bridge
