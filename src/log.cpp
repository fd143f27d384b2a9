#include "workshop/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

namespace workshop::log {
namespace {

bool env_enabled() {
  const char* env = std::getenv("WORKSHOP_LOG");
  if (!env) {
    return false;
  }
  std::string value(env);
  return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
}

std::atomic<bool>& enabled_flag() {
  static std::atomic<bool> flag{env_enabled()};
  return flag;
}

struct SinkState {
  std::mutex mutex;
  Sink sink;
};

SinkState& sink_state() {
  static SinkState state;
  return state;
}

} // namespace

bool enabled() { return enabled_flag().load(); }

void set_enabled(bool on) { enabled_flag().store(on); }

void set_sink(Sink sink) {
  auto& state = sink_state();
  std::scoped_lock guard(state.mutex);
  state.sink = std::move(sink);
}

void write(Level level, std::string_view tag, const std::string& message) {
  if (level != Level::Error && !enabled()) {
    return;
  }
  std::string line;
  line.reserve(tag.size() + message.size() + 3);
  line.append("[").append(tag).append("] ").append(message);

  Sink sink;
  {
    auto& state = sink_state();
    std::scoped_lock guard(state.mutex);
    sink = state.sink;
  }
  if (sink) {
    sink(level, line);
    return;
  }
  std::cerr << line << std::endl;
}

} // namespace workshop::log
