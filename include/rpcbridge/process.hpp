#pragma once

#ifndef BOOST_PROCESS_USE_STD_FS
#define BOOST_PROCESS_USE_STD_FS 1
#endif

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/process/v2/process.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rpcbridge/error.hpp"

namespace rpcbridge {

namespace fs = std::filesystem;

struct process_options {
  std::string command;
  std::vector<std::string> args{};
  // Added to (or overriding) the bridge's own environment.
  std::vector<std::pair<std::string, std::string>> env{};
  std::optional<fs::path> working_dir{};
  std::chrono::milliseconds grace_period{5000};
};

/** @brief Owns the one child process of a bridge.
 *
 * The supervisor is the only place that changes the child's lifecycle
 * state.  mark_exited() flips it to "exited" once; the caller that wins
 * that flip is responsible for failing whatever was waiting on the child.
 *
 * Pipes are used synchronously: one thread reads stdout, one reads stderr,
 * and writers to stdin are serialized by write().
 */
class process_supervisor {
 public:
  explicit process_supervisor(process_options opts);
  process_supervisor(const process_supervisor&) = delete;
  process_supervisor& operator=(const process_supervisor&) = delete;
  ~process_supervisor();

  /// Spawn the child.  Throws spawn_error if it can not be launched.
  void start();

  /** @brief Write one complete framed message to the child's stdin.
   *
   * Fails with process_not_running before start(), process_exited once
   * the exit has been observed (or the pipe is broken), write_failed for
   * any other I/O error.
   */
  std::expected<void, bridge_error> write(std::string_view line);

  /** @brief Stop the child: close stdin, SIGTERM, wait up to the grace
   * period, then SIGKILL.  Returns the exit code, if one was collected.
   *
   * Bounded even when a write() is blocked on a child that stopped reading:
   * stdin is then closed only after the kill has failed that write.
   */
  std::optional<int> terminate();

  /// Record that the child is gone.  True only for the first caller.
  bool mark_exited();

  /// Exit code if the child has already been reaped or can be reaped
  /// without blocking.
  std::optional<int> poll_exit_code();

  [[nodiscard]] bool started() const { return started_.load(); }
  [[nodiscard]] bool exited() const { return exited_.load(); }
  [[nodiscard]] const process_options& options() const { return opts_; }
  [[nodiscard]] int pid() const { return pid_; }

  boost::asio::readable_pipe& stdout_pipe() { return stdout_; }
  boost::asio::readable_pipe& stderr_pipe() { return stderr_; }

 private:
  // Close stdin unless a write() is in progress.  False if one is.
  bool close_stdin_if_idle();

  process_options opts_;
  boost::asio::io_context ctx_;
  boost::asio::writable_pipe stdin_{ctx_};
  boost::asio::readable_pipe stdout_{ctx_};
  boost::asio::readable_pipe stderr_{ctx_};
  std::optional<boost::process::v2::process> proc_;
  std::optional<int> exit_code_;
  int pid_{-1};

  std::mutex write_mutex_;
  std::mutex proc_mutex_;
  std::atomic<bool> started_{false};
  std::atomic<bool> exited_{false};
};

}  // namespace rpcbridge
