#include "rpcbridge/process.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <csignal>
#include <thread>

#include "logger.hpp"
#include "utils.hpp"

extern char** environ;  // NOLINT

namespace rpcbridge {

namespace p2 = boost::process::v2;
namespace asio = boost::asio;

namespace {

// The bridge's own environment with the configured overrides applied, in
// the "KEY=VALUE" form process_environment expects.
std::vector<std::string> child_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {
    std::string_view kv{*e};
    auto key = kv.substr(0, kv.find('='));
    bool overridden = std::ranges::any_of(
        overrides, [&](const auto& o) { return o.first == key; });
    if (!overridden) env.emplace_back(kv);
  }
  for (const auto& [key, value] : overrides)
    env.push_back(fmt::format("{}={}", key, value));
  return env;
}

// Runs in the forked child before exec: put it in a process group of its
// own so terminate() reaches whatever it spawns as well (npx -> node, ...).
struct new_process_group {
  template <typename Launcher, typename Executable, typename CmdLine>
  boost::system::error_code on_exec_setup(
      Launcher& /*launcher*/, const Executable& /*exe*/, CmdLine& /*argv*/) {
    if (::setpgid(0, 0) != 0)
      return {errno, boost::system::system_category()};
    return {};
  }
};

fs::path resolve_executable(const std::string& command) {
  if (command.find('/') != std::string::npos) return fs::path{command};
  return p2::environment::find_executable(command);
}

}  // namespace

process_supervisor::process_supervisor(process_options opts)
    : opts_{std::move(opts)} {}

process_supervisor::~process_supervisor() {
  if (started_) terminate();
}

void process_supervisor::start() {
  std::lock_guard lock{proc_mutex_};
  if (started_) utils::throwf<spawn_error>("child already started");

  // A child that dies under our feet must surface as EPIPE from write(),
  // not as a signal that takes the whole service down.
  std::signal(SIGPIPE, SIG_IGN);

  auto exe = resolve_executable(opts_.command);
  if (exe.empty())
    utils::throwf<spawn_error>(
        "cannot find executable '{}' on PATH", opts_.command);

  auto dir = opts_.working_dir.value_or(fs::current_path());

  LOG_INFO(
      "Spawning {}", fmt::format("{} {}", exe, fmt::join(opts_.args, " ")));
  LOG_DEBUG("Workdir {}", dir.string());

  try {
    proc_.emplace(
        ctx_, exe, opts_.args,
        p2::process_stdio{.in = stdin_, .out = stdout_, .err = stderr_},
        p2::process_start_dir{dir},
        p2::process_environment{child_environment(opts_.env)},
        new_process_group{});
  } catch (const boost::system::system_error& e) {
    utils::throwf<spawn_error>("failed to spawn '{}': {}", exe, e.what());
  }

  pid_ = static_cast<int>(proc_->id());
  started_ = true;
  LOG_INFO("Child running with pid {}", pid_);
}

std::expected<void, bridge_error> process_supervisor::write(
    std::string_view line) {
  if (!started_)
    return std::unexpected{bridge_error{
      error_kind::process_not_running, "child process is not running"}};

  std::lock_guard lock{write_mutex_};
  if (exited_)
    return std::unexpected{bridge_error{
      error_kind::process_exited, "child process has exited"}};

  boost::system::error_code ec{};
  asio::write(stdin_, asio::buffer(line.data(), line.size()), ec);
  if (!ec) return {};

  if (ec == asio::error::broken_pipe || ec == asio::error::bad_descriptor)
    return std::unexpected{bridge_error{
      error_kind::process_exited,
      fmt::format("child closed its stdin: {}", ec.message())}};
  return std::unexpected{bridge_error{
    error_kind::write_failed,
    fmt::format("write to child failed: {}", ec.message())}};
}

std::optional<int> process_supervisor::terminate() {
  std::lock_guard lock{proc_mutex_};
  if (!proc_) return exit_code_;

  // A writer stuck on a child that stopped reading holds write_mutex_
  // until the child dies, so signalling must not wait long for it.
  bool stdin_closed = close_stdin_if_idle();
  for (int i = 0; i < 20 && !stdin_closed; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
    stdin_closed = close_stdin_if_idle();
  }
  if (!stdin_closed)
    LOG_WARN("Child {} is not draining stdin, signalling it anyway", pid_);

  boost::system::error_code ec{};
  if (proc_->running(ec)) {
    LOG_INFO(
        "Stopping child {} (grace {}ms)", pid_, opts_.grace_period.count());
    ::killpg(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + opts_.grace_period;
    while (proc_->running(ec) && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds{20});
    if (proc_->running(ec)) {
      LOG_WARN("Child {} ignored SIGTERM, killing it", pid_);
      ::killpg(pid_, SIGKILL);
    }
  }
  // Stragglers in the group may still hold our pipes open.
  ::killpg(pid_, SIGKILL);
  auto code = proc_->wait(ec);
  if (ec) {
    LOG_WARN("Could not reap child {}: {}", pid_, ec.message());
  } else {
    exit_code_ = code;
    LOG_INFO("Child {} exited with code {}", pid_, code);
  }
  proc_.reset();
  mark_exited();

  // The blocked writer sees EPIPE once the group is gone.
  auto deadline = std::chrono::steady_clock::now() + opts_.grace_period;
  while (!stdin_closed) {
    stdin_closed = close_stdin_if_idle();
    if (stdin_closed || std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }
  if (!stdin_closed) LOG_WARN("Child stdin still busy after exit");
  return exit_code_;
}

bool process_supervisor::close_stdin_if_idle() {
  std::unique_lock wlock{write_mutex_, std::try_to_lock};
  if (!wlock) return false;
  boost::system::error_code ec{};
  stdin_.close(ec);
  return true;
}

bool process_supervisor::mark_exited() {
  bool expected{false};
  return exited_.compare_exchange_strong(expected, true);
}

std::optional<int> process_supervisor::poll_exit_code() {
  std::unique_lock lock{proc_mutex_, std::try_to_lock};
  if (!lock) return std::nullopt;
  if (!proc_) return exit_code_;
  boost::system::error_code ec{};
  if (proc_->running(ec) || ec) return std::nullopt;
  exit_code_ = proc_->exit_code();
  return exit_code_;
}

}  // namespace rpcbridge
