#include "rpcbridge/jsonrpc.hpp"

#include <fmt/format.h>

#include <system_error>
#include <utility>

namespace rpcbridge {

json::object make_result(const json::value& id, json::value result) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

json::object make_jsonrpc_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::object> data) {
  json::object err{};
  err["code"] = code;
  err["message"] = message;
  if (data) err["data"] = std::move(*data);
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

json::object make_error_response(
    const json::value& id, const bridge_error& err) {
  json::object data{};
  data["kind"] = to_string(err.kind);
  if (err.timeout) data["timeout_ms"] = err.timeout->count();
  return make_jsonrpc_error(
      id, INTERNAL_ERROR, fmt::format("Internal error: {}", err.message),
      std::move(data));
}

std::optional<std::string_view> method_of(const json::object& msg) {
  auto it = msg.find("method");
  if (it == msg.end()) return std::nullopt;
  if (auto* s = it->value().if_string()) return std::string_view{*s};
  return std::nullopt;
}

bool is_notification(const json::object& msg, std::string_view prefix) {
  if (!msg.contains("id")) return true;
  auto method = method_of(msg);
  return method && !prefix.empty() && method->starts_with(prefix);
}

std::string frame_jsonrpc_line(const json::object& msg) {
  std::string line{json::serialize(msg)};
  line += '\n';
  return line;
}

std::expected<json::object, bridge_error> parse_jsonrpc_line(
    std::string_view line) {
  std::error_code ec{};
  json::value parsed = json::parse(line, ec);
  if (ec)
    return std::unexpected{bridge_error{
      error_kind::parse_error, fmt::format("invalid JSON: {}", ec.message())}};
  auto* obj = parsed.if_object();
  if (!obj)
    return std::unexpected{
      bridge_error{error_kind::parse_error, "message is not a JSON object"}};
  return std::move(*obj);
}

}  // namespace rpcbridge
