#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 message helpers for the line-delimited child transport.
 *
 * Messages exchanged with the child are framed one per line: the compact
 * JSON text of the message followed by a single @c '\n'.  Boost.JSON never
 * emits a raw newline inside serialized text, so a serialized message can
 * not break the framing.
 */

#include <boost/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "rpcbridge/error.hpp"

namespace rpcbridge {

namespace json = boost::json;

// JSONRPC error codes
constexpr int PARSE_ERROR{-32700};
constexpr int INVALID_REQUEST{-32600};
constexpr int METHOD_NOT_FOUND{-32601};
constexpr int INVALID_PARAMS{-32602};
constexpr int INTERNAL_ERROR{-32603};

json::object make_result(const json::value& id, json::value result);

json::object make_jsonrpc_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::object> data = std::nullopt);

/** @brief Turn a bridge failure into an @c INTERNAL_ERROR response.
 *
 * The message reads @c "Internal error: <detail>" and @c data carries the
 * error kind (and @c timeout_ms for timeouts) so callers can tell a timeout
 * from a crash without parsing text.
 */
json::object make_error_response(
    const json::value& id, const bridge_error& err);

/// The @c method member, if present and a string.
std::optional<std::string_view> method_of(const json::object& msg);

/** @brief Whether @p msg is one-way.
 *
 * A message is a notification when it has no @c id member at all, or when
 * its method name starts with @p prefix (e.g. @c "notifications/").
 */
bool is_notification(const json::object& msg, std::string_view prefix);

/// Serialize @p msg and append the line terminator.
std::string frame_jsonrpc_line(const json::object& msg);

/** @brief Parse one line read from the child.
 *
 * Fails with @c error_kind::parse_error when the text is not JSON or is not
 * a JSON object.
 */
std::expected<json::object, bridge_error> parse_jsonrpc_line(
    std::string_view line);

}  // namespace rpcbridge
