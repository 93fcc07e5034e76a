#include <fmt/core.h>
#include <fmt/ranges.h>

#include <exception>
#include <iostream>
#include <span>

#include "../librpcbridge/logger.hpp"
#include "options.hpp"
#include "rpcbridge/bridge.hpp"
#include "web_server.hpp"

namespace logger = rpcbridge::logger;

namespace {

void print_banner(
    const rpcbridge::server_options& sopts,
    const rpcbridge::bridge_options& bopts, unsigned short port) {
  fmt::println("{:=<60}", "");
  fmt::println("stdio JSON-RPC to HTTP bridge");
  fmt::println("{:=<60}", "");
  fmt::println(
      "  child      : {} {}", bopts.process.command,
      fmt::join(bopts.process.args, " "));
  fmt::println(
      "  listening  : http://{}:{}{}", sopts.host, port, sopts.base_path);
  fmt::println("  timeout    : {}ms", bopts.timeout.count());
  fmt::println("  transport  : streamable_http");
  fmt::println("  press Ctrl-C to stop");
  fmt::println("{:=<60}", "");
  std::cout.flush();
}

}  // namespace

int main(int argc, char* argv[]) {
  rpcbridge::server_options sopts{};
  rpcbridge::bridge_options bopts{};
  int loglevel{3};

  auto done = rpcbridge::parse_options(
      std::span(argv, argc), loglevel, sopts, bopts);
  if (done) return done.value();

  logger::set_level(static_cast<logger::level>(loglevel));
  LOG_DEBUG("loglevel={}", loglevel);

  rpcbridge::bridge bridge{bopts};
  try {
    bridge.start();
  } catch (const rpcbridge::spawn_error& e) {
    LOG_FATAL("Could not start child: {}", e.what());
    return 1;
  }

  sopts.handle_signals = true;
  try {
    rpcbridge::web_server server{bridge, sopts};
    auto port = server.listen();
    print_banner(sopts, bopts, port);
    server.run();
    // Fail whatever is still waiting so the workers can finish before the
    // server joins them.
    bridge.shutdown();
  } catch (const std::exception& e) {
    LOG_FATAL("Server error: {}", e.what());
    bridge.shutdown();
    return 1;
  }

  return 0;
}
