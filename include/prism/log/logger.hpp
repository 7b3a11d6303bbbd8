#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace prism::log {

enum class Level : int { debug = 1, info = 2, warn = 3, error = 4, off = 6 };

std::string_view to_string(Level lv);

// Parses "debug", "info", "warn", "error" or "off"; anything else yields fallback.
Level parse_level(std::string_view name, Level fallback = Level::info);

/// @brief Process-wide leveled logger writing "[HH:MM:SS L tag] message" lines to stderr
class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) {
    level_.store(lv, std::memory_order_relaxed);
  }

  Level level() const {
    return level_.load(std::memory_order_relaxed);
  }

  bool enabled(Level lv) const {
    return lv >= level();
  }

  /// @brief Tag attached to every line logged from the calling thread (empty: none)
  static void set_thread_tag(std::string tag);
  static const std::string &thread_tag();

  /// @brief Format with {fmt} and write; arguments are not formatted when lv is filtered out
  template <class... Args>
  void log(Level lv, fmt::format_string<Args...> pattern, Args &&...args) {
    if (!enabled(lv))
      return;
    write(lv, fmt::format(pattern, std::forward<Args>(args)...));
  }

  // Single formatted line, serialized across threads
  void write(Level lv, std::string_view body);

  /// @brief Last line handed to write(), kept for inspection
  std::string last_line();

private:
  std::atomic<Level> level_{Level::info}; // default INFO
  std::mutex mu_;
  std::string last_;
};

// convenience macros
#define PLOG_DEBUG(...)                                                        \
  ::prism::log::Logger::instance().log(::prism::log::Level::debug,             \
                                       __VA_ARGS__)
#define PLOG_INFO(...)                                                         \
  ::prism::log::Logger::instance().log(::prism::log::Level::info,              \
                                       __VA_ARGS__)
#define PLOG_WARN(...)                                                         \
  ::prism::log::Logger::instance().log(::prism::log::Level::warn,              \
                                       __VA_ARGS__)
#define PLOG_ERROR(...)                                                        \
  ::prism::log::Logger::instance().log(::prism::log::Level::error,             \
                                       __VA_ARGS__)

} // namespace prism::log
