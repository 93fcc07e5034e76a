#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../librpcbridge/logger.hpp"
#include "rpcbridge/jsonrpc.hpp"
#include "web_server.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace rpcbridge {

namespace {

constexpr std::string_view kVersion{"0.1.0"};
constexpr std::string_view kTransport{"streamable_http"};
// Requests larger than this are refused by the parser.
constexpr std::uint64_t kBodyLimit{64ULL * 1024 * 1024};

/// Helpers

std::string_view to_sv(beast::string_view s) { return {s.data(), s.size()}; }

void set_cors(http_response& res) {
  res.set(http::field::access_control_allow_origin, "*");
}

http_response make_json_response(
    http::status status_code, const json::value& body,
    unsigned int http_version, bool keep_alive) {
  http_response res{status_code, http_version};
  res.set(http::field::content_type, "application/json");
  set_cors(res);
  res.keep_alive(keep_alive);
  res.body() = json::serialize(body);
  res.prepare_payload();
  return res;
}

http_response make_error(
    http::status status_code, std::string_view message,
    unsigned int http_version, bool keep_alive) {
  json::object obj;
  obj["error"] = message;
  return make_json_response(status_code, obj, http_version, keep_alive);
}

http_response make_empty(
    http::status status_code, unsigned int http_version, bool keep_alive) {
  http_response res{status_code, http_version};
  set_cors(res);
  res.keep_alive(keep_alive);
  res.prepare_payload();
  return res;
}

// "/mcp/" and "/mcp" name the same endpoint; the query string is ignored.
std::string_view normalize_path(std::string_view target) {
  target = target.substr(0, target.find('?'));
  while (target.size() > 1 && target.back() == '/') target.remove_suffix(1);
  return target;
}

json::object make_descriptor(
    const http_request& req, const bridge& b, const server_options& opts) {
  std::string host{to_sv(req[http::field::host])};
  if (host.empty()) host = "localhost";
  auto url = "http://" + host + std::string{normalize_path(opts.base_path)};
  if (url.back() == '/') url.pop_back();

  json::object endpoint;
  endpoint["url"] = url;
  endpoint["transport"] = kTransport;
  json::object client_config;
  client_config[opts.name] = std::move(endpoint);

  json::object obj;
  obj["name"] = opts.name;
  obj["version"] = kVersion;
  obj["transport"] = kTransport;
  obj["description"] =
      "JSON-RPC over stdio child process, exposed via HTTP bridge";
  obj["command"] = b.options().process.command;
  obj["client_config"] = std::move(client_config);
  return obj;
}

// POST body -> bridge.  Empty optional means 204.
std::optional<json::object> handle_rpc(std::string_view body, bridge& b) {
  std::error_code ec{};
  json::value parsed = json::parse(body, ec);
  if (ec) {
    json::object data{};
    data["details"] = ec.message();
    return make_jsonrpc_error(nullptr, PARSE_ERROR, "Parse error", data);
  }

  auto* msg = parsed.if_object();
  if (!msg)
    return make_jsonrpc_error(nullptr, INVALID_REQUEST, "Invalid Request");

  if (!method_of(*msg)) {
    json::value id{nullptr};
    if (auto it = msg->find("id"); it != msg->end()) id = it->value();
    return make_jsonrpc_error(id, INVALID_REQUEST, "missing method");
  }

  return b.handle(*msg);
}

}  // namespace

/// Request dispatch

http_response dispatch(
    const http_request& req, bridge& b, const server_options& opts) {
  const auto version = req.version();
  const bool keep_alive = req.keep_alive();

  if (normalize_path(to_sv(req.target())) != normalize_path(opts.base_path))
    return make_error(
        http::status::not_found, "not found", version, keep_alive);

  try {
    switch (req.method()) {
      case http::verb::post: {
        auto reply = handle_rpc(req.body(), b);
        if (!reply)
          return make_empty(http::status::no_content, version, keep_alive);
        return make_json_response(
            http::status::ok, *reply, version, keep_alive);
      }
      case http::verb::get:
        return make_json_response(
            http::status::ok, make_descriptor(req, b, opts), version,
            keep_alive);
      case http::verb::options: {
        auto res = make_empty(http::status::no_content, version, keep_alive);
        res.set(
            http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "*");
        return res;
      }
      default: {
        auto res = make_error(
            http::status::method_not_allowed, "method not allowed", version,
            keep_alive);
        res.set(http::field::allow, "GET, POST, OPTIONS");
        return res;
      }
    }
  } catch (const std::exception& e) {
    LOG_ERROR(
        "Error handling {} {}: {}", to_sv(req.method_string()),
        to_sv(req.target()), e.what());
    json::object data{};
    data["details"] = e.what();
    return make_json_response(
        http::status::ok,
        make_jsonrpc_error(nullptr, INTERNAL_ERROR, "Internal error", data),
        version, keep_alive);
  }
}

/// Connection handler

void handle_connection(
    boost::asio::ip::tcp::socket& socket, bridge& b,
    const server_options& opts) {
  beast::flat_buffer buffer;
  boost::system::error_code ec;

  for (;;) {
    http::request_parser<http::string_body> parser;
    parser.body_limit(kBodyLimit);
    http::read(socket, buffer, parser, ec);
    if (ec) break;  // end_of_stream included

    const auto& req = parser.get();
    LOG_DEBUG("{} {}", to_sv(req.method_string()), to_sv(req.target()));

    auto res = dispatch(req, b, opts);
    LOG_DEBUG("-> {}", static_cast<unsigned>(res.result_int()));
    http::write(socket, res, ec);
    if (ec || !req.keep_alive()) break;
  }

  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}

}  // namespace rpcbridge
