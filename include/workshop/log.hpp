#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace workshop::log {

enum class Level { Debug, Info, Error };

using Sink = std::function<void(Level, const std::string&)>;

// Debug and info lines are written only when WORKSHOP_LOG is set to something
// other than "", "0", "false" or "FALSE". Errors are always written.
bool enabled();
void set_enabled(bool on);

// Replaces the std::cerr sink; an empty function restores it.
void set_sink(Sink sink);

void write(Level level, std::string_view tag, const std::string& message);

inline void debug(std::string_view tag, const std::string& message) {
  write(Level::Debug, tag, message);
}

inline void info(std::string_view tag, const std::string& message) {
  write(Level::Info, tag, message);
}

inline void error(std::string_view tag, const std::string& message) {
  write(Level::Error, tag, message);
}

} // namespace workshop::log
