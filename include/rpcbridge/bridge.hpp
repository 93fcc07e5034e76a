#pragma once

/**
 * @file bridge.hpp
 * @brief Many concurrent JSONRPC callers multiplexed onto one stdio child.
 *
 * A bridge owns one child process (see process.hpp), a correlation table
 * keyed by internal ids (see correlation.hpp) and two standing threads: one
 * reading the child's stdout and resolving table entries, one draining the
 * child's stderr into the log.  Request threads call handle() (or call() /
 * notify()) concurrently; they only ever block on their own completion slot
 * or on their turn to write to the child's stdin.
 */

#include <atomic>
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "rpcbridge/correlation.hpp"
#include "rpcbridge/error.hpp"
#include "rpcbridge/line_framer.hpp"
#include "rpcbridge/process.hpp"

namespace rpcbridge {

namespace json = boost::json;

enum class bridge_state : uint8_t { uninitialized, starting, running, exited };

std::string_view to_string(bridge_state state);

struct bridge_options {
  process_options process;
  std::chrono::milliseconds timeout{30000};
  std::string notification_prefix{"notifications/"};
  std::size_t max_line{line_framer::default_max_line};
};

struct bridge_stats {
  uint64_t requests{};
  uint64_t notifications{};
  uint64_t responses{};
  uint64_t timeouts{};
  uint64_t dropped{};    // replies nobody was waiting for
  uint64_t malformed{};  // lines that were not JSON objects
};

class bridge {
 public:
  explicit bridge(bridge_options opts);
  bridge(const bridge&) = delete;
  bridge& operator=(const bridge&) = delete;
  ~bridge();

  /// Spawn the child and the reader threads.  Throws spawn_error.
  void start();

  /** @brief Fail everything in flight, stop the child, join the threads.
   *
   * Safe to call more than once; the destructor calls it too.
   */
  void shutdown();

  /** @brief The HTTP-facing operation.
   *
   * Notifications are forwarded and yield an empty optional (the empty
   * acknowledgment).  Requests yield the child's response with the caller's
   * id restored, or a JSONRPC error object for any bridge failure.  Never
   * throws for per-request failures.
   */
  std::optional<json::object> handle(const json::object& msg);

  /// Forward a request and wait for its response, bounded by @p timeout.
  outcome call(json::object request, std::chrono::milliseconds timeout);
  outcome call(json::object request) {
    return call(std::move(request), opts_.timeout);
  }

  /// Forward a notification.  Does not wait for anything.
  std::expected<void, bridge_error> notify(const json::object& msg);

  [[nodiscard]] bridge_state state() const { return state_.load(); }
  [[nodiscard]] std::size_t pending() const { return table_.size(); }
  [[nodiscard]] bridge_stats stats() const;
  [[nodiscard]] const bridge_options& options() const { return opts_; }

 private:
  void read_responses();
  void drain_stderr();
  void on_child_gone(const std::string& why);

  bridge_options opts_;
  process_supervisor child_;
  correlation_table table_;
  id_remapper remapper_{table_};
  std::atomic<bridge_state> state_{bridge_state::uninitialized};

  std::thread reader_;
  std::thread stderr_reader_;
  std::mutex lifecycle_mutex_;
  bool shut_down_{false};
  std::atomic<bool> stopping_{false};

  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> notifications_{0};
  std::atomic<uint64_t> responses_{0};
  std::atomic<uint64_t> timeouts_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> malformed_{0};
};

}  // namespace rpcbridge
