#pragma once

#include "fs.hpp"
#include "log.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <variant>

namespace workshop {

// Default loader used by LazySlot<T>; specialised next to each loadable type.
template <typename T>
struct SlotLoader;

template <>
struct SlotLoader<std::string> {
  static std::string load(const std::filesystem::path& path) { return read_text_file(path); }
};

// Loads once under the exclusive lock. A throwing loader leaves the slot
// unloaded.
template <typename T>
class LazySlot {
public:
  using Loader = std::function<T(const std::filesystem::path&)>;

  explicit LazySlot(std::filesystem::path source)
      : LazySlot(std::move(source),
                 [](const std::filesystem::path& path) { return SlotLoader<T>::load(path); }) {}

  LazySlot(std::filesystem::path source, Loader loader)
      : source_(source), state_(std::in_place_index<0>, std::move(source)), loader_(std::move(loader)) {}

  LazySlot(const LazySlot&) = delete;
  LazySlot& operator=(const LazySlot&) = delete;

  // Loads on first use and returns a copy of the cached value.
  T get() {
    std::unique_lock lock(mutex_);
    return try_load();
  }

  // Loads on first use and runs fn on the cached value inside the critical
  // section; fn may modify it.
  template <typename Fn>
  decltype(auto) with(Fn&& fn) {
    std::unique_lock lock(mutex_);
    return std::forward<Fn>(fn)(try_load());
  }

  void replace(T value) {
    std::unique_lock lock(mutex_);
    state_.template emplace<1>(std::move(value));
  }

  bool is_loaded() const {
    std::shared_lock lock(mutex_);
    return std::holds_alternative<T>(state_);
  }

  const std::filesystem::path& source() const { return source_; }

private:
  T& try_load() {
    if (auto* value = std::get_if<T>(&state_)) {
      log::debug("lazy slot", "returning cached value for " + source_.string());
      return *value;
    }
    log::debug("lazy slot", "loading " + source_.string());
    T loaded = loader_(source_);
    return state_.template emplace<1>(std::move(loaded));
  }

  const std::filesystem::path source_;
  mutable std::shared_mutex mutex_;
  std::variant<std::filesystem::path, T> state_;
  Loader loader_;
};

template <typename T>
using SharedSlot = std::shared_ptr<LazySlot<T>>;

template <typename T>
SharedSlot<T> make_slot(const std::filesystem::path& source) {
  return std::make_shared<LazySlot<T>>(source);
}

template <typename T>
SharedSlot<T> make_slot(const std::filesystem::path& source,
                        typename LazySlot<T>::Loader loader) {
  return std::make_shared<LazySlot<T>>(source, std::move(loader));
}

} // namespace workshop
