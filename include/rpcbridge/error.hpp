#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rpcbridge {

enum class error_kind : uint8_t {
  spawn_error,
  process_not_running,
  process_exited,
  process_crashed,
  request_timeout,
  write_failed,
  parse_error,
};

inline std::string_view to_string(error_kind kind) {
  // clang-format off
  switch (kind) {
  case error_kind::spawn_error:         return "spawn_error";
  case error_kind::process_not_running: return "process_not_running";
  case error_kind::process_exited:      return "process_exited";
  case error_kind::process_crashed:     return "process_crashed";
  case error_kind::request_timeout:     return "request_timeout";
  case error_kind::write_failed:        return "write_failed";
  case error_kind::parse_error:         return "parse_error";
  default: return "unknown";
  }
  // clang-format on
}

/// A per-request failure, returned by value from the await operations.
struct bridge_error {
  error_kind kind;
  std::string message;
  // Set for request_timeout: the bound that elapsed.
  std::optional<std::chrono::milliseconds> timeout{};
};

/// The child could not be launched.  Fatal to bridge startup.
struct spawn_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace rpcbridge
