#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <mutex>
#include <print>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace rpcbridge::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }
inline bool enabled(level level) { return level <= global_level; }

// Which of the bridge's threads a line came from: "main", "stdout",
// "stderr" or "http".  Set once at the top of each thread.
inline thread_local std::string_view thread_tag{"main"};  // NOLINT
inline void set_thread_tag(std::string_view tag) { thread_tag = tag; }

inline std::string format_line(
    level level, const std::source_location& location, std::string_view text) {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto today = floor<days>(now);
  return std::format(
      "{} {} [{}] {}:{} {}: {}", year_month_day{today},
      hh_mm_ss{floor<milliseconds>(now - today)}, thread_tag,
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level), text);
}

inline void emit(const std::string& line) {
  static std::mutex mutex;
  std::lock_guard lock{mutex};
  std::println("{}", line);
  std::fflush(stdout);
}

template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    std::format_string<Args...> fmt, Args&&... args) {
  if (!enabled(level)) return;
  emit(format_line(
      level, location, std::format(fmt, std::forward<Args>(args)...)));
}

}  // namespace rpcbridge::logger

// NOLINTBEGIN
#define RPCBRIDGE_LOG(lvl, ...)                                        \
  rpcbridge::logger::log(                                              \
      rpcbridge::logger::level::lvl, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_TRACE(...) RPCBRIDGE_LOG(trace, __VA_ARGS__)
#define LOG_DEBUG(...) RPCBRIDGE_LOG(debug, __VA_ARGS__)
#define LOG_INFO(...) RPCBRIDGE_LOG(info, __VA_ARGS__)
#define LOG_WARN(...) RPCBRIDGE_LOG(warning, __VA_ARGS__)
#define LOG_ERROR(...) RPCBRIDGE_LOG(error, __VA_ARGS__)
#define LOG_FATAL(...) RPCBRIDGE_LOG(fatal, __VA_ARGS__)
// NOLINTEND
