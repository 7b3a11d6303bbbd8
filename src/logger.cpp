#include <chrono>
#include <cstdio>
#include <ctime>
#include <prism/log/logger.hpp>

namespace prism::log {

namespace {

thread_local std::string t_tag;

} // namespace

std::string_view to_string(Level lv) {
  switch (lv) {
  case Level::debug:
    return "D";
  case Level::info:
    return "I";
  case Level::warn:
    return "W";
  case Level::error:
    return "E";
  default:
    return "O";
  }
}

Level parse_level(std::string_view name, Level fallback) {
  if (name == "debug")
    return Level::debug;
  if (name == "info")
    return Level::info;
  if (name == "warn")
    return Level::warn;
  if (name == "error")
    return Level::error;
  if (name == "off")
    return Level::off;
  return fallback;
}

void Logger::set_thread_tag(std::string tag) {
  t_tag = std::move(tag);
}

const std::string &Logger::thread_tag() {
  return t_tag;
}

void Logger::write(Level lv, std::string_view body) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  char tbuf[9];
  std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm);

  const std::string line = t_tag.empty()
                               ? fmt::format("[{} {}] {}\n", tbuf, to_string(lv), body)
                               : fmt::format("[{} {} {}] {}\n", tbuf, to_string(lv), t_tag, body);

  std::scoped_lock lk(mu_);
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
  last_ = line;
}

std::string Logger::last_line() {
  std::scoped_lock lk(mu_);
  return last_;
}

} // namespace prism::log
