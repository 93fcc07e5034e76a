#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rpcbridge::utils {
template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Split "KEY=VALUE".  Returns false if there is no '=' or the key is empty.
inline bool split_env_assignment(
    std::string_view text, std::string& key, std::string& value) {
  auto eq = text.find('=');
  if (eq == std::string_view::npos || eq == 0) return false;
  key = std::string{text.substr(0, eq)};
  value = std::string{text.substr(eq + 1)};
  return true;
}

}  // namespace rpcbridge::utils
