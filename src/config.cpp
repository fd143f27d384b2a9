#include "workshop/config.hpp"

#include "json_bridge.hpp"
#include "workshop/error.hpp"
#include "workshop/log.hpp"

#include <system_error>

namespace workshop {

Config Config::load(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    log::info("config", "loading " + path.string());
    auto config = bridge::config_from_json(bridge::load_json_file(path));
    return config;
  }
  log::info("config", "creating " + path.string());
  Config config;
  config.save(path);
  return config;
}

void Config::save(const std::filesystem::path& path) const {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw Error(ErrorKind::Io, path.parent_path().string() + ": " + ec.message());
    }
  }
  bridge::save_json_file(path, bridge::to_json(*this));
  log::info("config", "saved " + path.string());
}

} // namespace workshop
