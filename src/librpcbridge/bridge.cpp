#include "rpcbridge/bridge.hpp"

#include <fmt/format.h>

#include <boost/asio/error.hpp>
#include <future>
#include <utility>

#include "logger.hpp"
#include "rpcbridge/jsonrpc.hpp"

namespace rpcbridge {

namespace asio = boost::asio;

namespace {

// Keep log lines readable when the child spews something huge.
std::string_view excerpt(std::string_view text) {
  constexpr std::size_t max_len{200};
  return text.substr(0, max_len);
}

bridge_error not_running() {
  return {error_kind::process_not_running, "child process is not running"};
}

}  // namespace

std::string_view to_string(bridge_state state) {
  // clang-format off
  switch (state) {
  case bridge_state::uninitialized: return "uninitialized";
  case bridge_state::starting:      return "starting";
  case bridge_state::running:       return "running";
  case bridge_state::exited:        return "exited";
  default: return "unknown";
  }
  // clang-format on
}

bridge::bridge(bridge_options opts)
    : opts_{std::move(opts)}, child_{opts_.process} {}

bridge::~bridge() { shutdown(); }

void bridge::start() {
  std::lock_guard lock{lifecycle_mutex_};
  if (state_ != bridge_state::uninitialized)
    throw spawn_error{fmt::format(
        "bridge cannot start from state {}", to_string(state_.load()))};

  state_ = bridge_state::starting;
  try {
    child_.start();
  } catch (const spawn_error&) {
    state_ = bridge_state::exited;
    table_.fail_all(not_running());
    throw;
  }
  state_ = bridge_state::running;

  reader_ = std::thread{[this] {
    logger::set_thread_tag("stdout");
    read_responses();
  }};
  stderr_reader_ = std::thread{[this] {
    logger::set_thread_tag("stderr");
    drain_stderr();
  }};
}

void bridge::shutdown() {
  std::lock_guard lock{lifecycle_mutex_};
  if (shut_down_) return;
  shut_down_ = true;
  stopping_ = true;

  auto previous = state_.exchange(bridge_state::exited);
  auto failed = table_.fail_all(
      {error_kind::process_not_running, "bridge is shutting down"});
  if (failed > 0)
    LOG_WARN("Shutting down with {} request(s) still pending", failed);

  if (child_.started()) child_.terminate();
  if (reader_.joinable()) reader_.join();
  if (stderr_reader_.joinable()) stderr_reader_.join();

  if (previous != bridge_state::uninitialized) {
    auto s = stats();
    LOG_INFO(
        "Bridge stopped: {} requests, {} notifications, {} responses, "
        "{} timeouts, {} dropped, {} malformed",
        s.requests, s.notifications, s.responses, s.timeouts, s.dropped,
        s.malformed);
  }
}

bridge_stats bridge::stats() const {
  return {
    .requests = requests_.load(),
    .notifications = notifications_.load(),
    .responses = responses_.load(),
    .timeouts = timeouts_.load(),
    .dropped = dropped_.load(),
    .malformed = malformed_.load(),
  };
}

/// Reader side

void bridge::read_responses() {
  line_reader reader{child_.stdout_pipe(), opts_.max_line};

  while (auto line = reader.next()) {
    auto msg = parse_jsonrpc_line(*line);
    if (!msg) {
      ++malformed_;
      LOG_WARN(
          "Failed to parse child output ({}): {}", msg.error().message,
          excerpt(*line));
      continue;
    }

    // Requests and notifications the child sends on its own are not
    // routed anywhere: there is no caller to hand them to.
    if (auto method = method_of(*msg)) {
      ++dropped_;
      LOG_DEBUG("Ignoring child-originated message {}", *method);
      continue;
    }

    auto id = id_remapper::internal_id_of(*msg);
    if (!id) {
      ++dropped_;
      LOG_WARN("Dropping child reply without a usable id: {}", excerpt(*line));
      continue;
    }

    if (!table_.resolve(*id, std::move(*msg))) {
      ++dropped_;
      LOG_DEBUG("Dropping reply for id {}: nobody is waiting for it", *id);
      continue;
    }
    ++responses_;
  }

  malformed_ += reader.discarded();
  if (reader.error() == asio::error::eof) {
    on_child_gone("child closed its stdout");
  } else {
    on_child_gone(fmt::format(
        "reading child stdout failed: {}", reader.error().message()));
  }
}

void bridge::drain_stderr() {
  line_reader reader{child_.stderr_pipe(), opts_.max_line};
  while (auto line = reader.next()) LOG_INFO("[child] {}", *line);
}

void bridge::on_child_gone(const std::string& why) {
  bool first = child_.mark_exited();
  state_ = bridge_state::exited;
  auto failed = table_.fail_all({error_kind::process_crashed, why});
  // An exit we asked for is logged by the supervisor.
  if (!first || stopping_) return;

  std::optional<int> code{};
  for (int i = 0; i < 10 && !code; ++i) {
    code = child_.poll_exit_code();
    if (!code) std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }
  if (code) {
    LOG_ERROR(
        "Child process gone ({}, exit code {}); failed {} pending request(s)",
        why, *code, failed);
  } else {
    LOG_ERROR(
        "Child process gone ({}); failed {} pending request(s)", why, failed);
  }
}

/// Caller side

outcome bridge::call(json::object request, std::chrono::milliseconds timeout) {
  if (state_ != bridge_state::running) return std::unexpected{not_running()};

  auto pending = remapper_.remap(request);
  if (!pending) return std::unexpected{pending.error()};
  ++requests_;

  auto line = frame_jsonrpc_line(request);
  if (auto written = child_.write(line); !written) {
    if (written.error().kind == error_kind::process_exited) {
      // Broken pipe: the child is gone, and so is everyone waiting on it,
      // this request included.
      on_child_gone(written.error().message);
    } else {
      table_.abandon(pending->internal_id, written.error());
    }
  } else if (
      pending->completion.wait_for(timeout) == std::future_status::timeout) {
    bridge_error err{
      error_kind::request_timeout,
      fmt::format("request timed out after {}ms", timeout.count()), timeout};
    if (table_.abandon(pending->internal_id, std::move(err))) {
      ++timeouts_;
      LOG_WARN(
          "Request {} (internal id {}) timed out after {}ms",
          json::serialize(pending->client_id), pending->internal_id,
          timeout.count());
    }
  }

  // Whoever removed the entry has fulfilled the slot by now.
  auto result = pending->completion.get();
  if (result) id_remapper::restore(*result, pending->client_id);
  return result;
}

std::expected<void, bridge_error> bridge::notify(const json::object& msg) {
  if (state_ != bridge_state::running) return std::unexpected{not_running()};
  ++notifications_;

  auto written = child_.write(frame_jsonrpc_line(msg));
  if (!written && written.error().kind == error_kind::process_exited)
    on_child_gone(written.error().message);
  return written;
}

std::optional<json::object> bridge::handle(const json::object& msg) {
  auto method = std::string{method_of(msg).value_or("<none>")};

  if (is_notification(msg, opts_.notification_prefix)) {
    LOG_INFO("Received notification: {}", method);
    if (auto sent = notify(msg); !sent)
      LOG_WARN(
          "Notification {} not forwarded: {}", method, sent.error().message);
    return std::nullopt;
  }

  json::value client_id{nullptr};
  if (auto it = msg.find("id"); it != msg.end()) client_id = it->value();
  LOG_INFO("Received: {} (id: {})", method, json::serialize(client_id));

  auto result = call(msg);
  if (!result) {
    LOG_WARN(
        "Request {} (id: {}) failed: {} ({})", method,
        json::serialize(client_id), result.error().message,
        to_string(result.error().kind));
    return make_error_response(client_id, result.error());
  }
  return std::move(*result);
}

}  // namespace rpcbridge
