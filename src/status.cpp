#include "workshop/status.hpp"

#include "json_bridge.hpp"
#include "workshop/error.hpp"
#include "workshop/log.hpp"

#include <system_error>
#include <utility>

namespace workshop {

Status::Status(std::filesystem::path status_path, std::filesystem::path config_path, Config config)
    : status_path_(std::move(status_path)),
      config_path_(std::move(config_path)),
      config_(std::move(config)) {}

Status Status::load(const std::filesystem::path& status_path,
                    const std::filesystem::path& config_path) {
  Status status(status_path, config_path, Config::load(config_path));
  if (std::filesystem::exists(status_path)) {
    log::info("status", "loading " + status_path.string());
    status.record_ = bridge::status_record_from_json(bridge::load_json_file(status_path));
    return status;
  }
  status.record_.spoken_language = status.config_.spoken_language;
  status.record_.programming_language = status.config_.programming_language;
  return status;
}

void Status::save() const {
  if (status_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(status_path_.parent_path(), ec);
    if (ec) {
      throw Error(ErrorKind::Io, status_path_.parent_path().string() + ": " + ec.message());
    }
  }
  bridge::save_json_file(status_path_, bridge::to_json(record_));
  log::info("status", "saved " + status_path_.string());
  config_.save(config_path_);
}

void Status::set_spoken_language(std::optional<spoken::Code> code, bool make_default) {
  record_.spoken_language = code;
  if (make_default) {
    config_.spoken_language = code;
  }
}

void Status::set_programming_language(std::optional<programming::Code> code, bool make_default) {
  record_.programming_language = code;
  if (make_default) {
    config_.programming_language = code;
  }
}

void Status::set_workshop(std::optional<std::string> workshop) {
  record_.workshop = std::move(workshop);
}

void Status::set_lesson(std::optional<std::string> lesson) { record_.lesson = std::move(lesson); }

} // namespace workshop
