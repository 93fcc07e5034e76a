#pragma once

#include <optional>
#include <span>

#include "rpcbridge/bridge.hpp"
#include "web_server.hpp"

namespace rpcbridge {

// Fills @p sopts and @p bopts from the command line (and the environment
// variables named in --help).  Returns an exit code when the program should
// stop right away (--help, bad arguments).
std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, server_options& sopts,
    bridge_options& bopts);

}  // namespace rpcbridge
