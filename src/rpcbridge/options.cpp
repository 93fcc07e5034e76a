#include "options.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "../librpcbridge/utils.hpp"

namespace rpcbridge {

namespace {

std::chrono::milliseconds to_millis(double seconds) {
  return std::chrono::milliseconds{static_cast<long long>(seconds * 1000.0)};
}

}  // namespace

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, server_options& sopts,
    bridge_options& bopts) {
  CLI::App app{
    "Expose a line-delimited JSON-RPC stdio server as an HTTP endpoint"};
  app.usage("rpcbridge [OPTIONS] [--] COMMAND [ARGS...]");
  // Everything from the first positional on belongs to the child.
  app.prefix_command();

  double timeout_s{30.0};
  double grace_s{5.0};
  std::vector<std::string> env_assignments{};
  std::string cwd{};

  app.add_option("--host", sopts.host, "Address to listen on")
    ->envname("RPCBRIDGE_HOST")
    ->capture_default_str();
  app.add_option("-p,--port", sopts.port, "Port to listen on")
    ->envname("PORT")
    ->capture_default_str();
  app.add_option("--path", sopts.base_path, "Base path of the endpoint")
    ->envname("RPCBRIDGE_PATH")
    ->capture_default_str();
  app.add_option("--name", sopts.name, "Service name in the descriptor")
    ->capture_default_str();
  app.add_option(
      "--max-connections", sopts.max_connections,
      "Concurrent HTTP connections served")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option("-t,--timeout", timeout_s, "Per-request timeout (seconds)")
    ->envname("RPCBRIDGE_TIMEOUT")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--grace", grace_s,
      "Seconds the child gets to exit after SIGTERM before SIGKILL")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option(
      "--notification-prefix", bopts.notification_prefix,
      "Methods starting with this are forwarded without waiting")
    ->capture_default_str();
  app.add_option(
      "-e,--env", env_assignments,
      "KEY=VALUE added to the child's environment (repeatable)")
    ->allow_extra_args(false)
    ->check([](const std::string& s) -> std::string {
      std::string key, value;
      if (utils::split_env_assignment(s, key, value)) return {};
      return "expected KEY=VALUE, got '" + s + "'";
    });
  app.add_option("-C,--cwd", cwd, "Working directory of the child")
    ->check(CLI::ExistingDirectory);
  app.add_option("-d,--debug", loglevel, "Debug log level (0=FATAL .. 5=TRACE)")
    ->check(CLI::Range(0, 5))
    ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  auto command_line = app.remaining();
  if (!command_line.empty() && command_line.front() == "--")
    command_line.erase(command_line.begin());
  if (command_line.empty()) {
    return app.exit(CLI::RequiredError{"COMMAND"});
  }

  bopts.process.command = command_line.front();
  bopts.process.args.assign(command_line.begin() + 1, command_line.end());
  for (const auto& kv : env_assignments) {
    std::string key, value;
    utils::split_env_assignment(kv, key, value);
    bopts.process.env.emplace_back(std::move(key), std::move(value));
  }
  if (!cwd.empty()) bopts.process.working_dir = cwd;
  bopts.process.grace_period = to_millis(grace_s);
  bopts.timeout = to_millis(timeout_s);

  return std::nullopt;
}

}  // namespace rpcbridge
