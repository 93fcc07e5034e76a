#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "rpcbridge/error.hpp"

namespace rpcbridge {

namespace json = boost::json;

using internal_id_t = int64_t;

/// What a request eventually yields: the child's raw response or a failure.
using outcome = std::expected<json::object, bridge_error>;

struct pending_request {
  internal_id_t internal_id;
  json::value client_id;
  std::promise<outcome> completion;
};

/** @brief Internal id -> pending request, shared by all request threads
 * and the reader thread.
 *
 * Every operation takes the same lock, so id allocation, insertion,
 * removal and the crash drain never interleave.  Each entry's completion
 * slot is fulfilled exactly once: by whichever of resolve(), abandon() or
 * fail_all() removes the entry from the map.
 */
class correlation_table {
 public:
  struct registration {
    internal_id_t internal_id;
    std::future<outcome> completion;
  };

  correlation_table() = default;
  correlation_table(const correlation_table&) = delete;
  correlation_table& operator=(const correlation_table&) = delete;

  /// Allocate the next internal id and insert an entry for it.  Fails with
  /// the drain reason once fail_all() has closed the table.
  std::expected<registration, bridge_error> insert(json::value client_id);

  /// Remove @p id and complete it with @p response.  False when @p id is not
  /// pending (late, duplicate or unknown).
  bool resolve(internal_id_t id, json::object response);

  /// Remove @p id and complete it with @p err.  False when the entry is
  /// already gone, in which case its slot holds whatever removed it.
  bool abandon(internal_id_t id, bridge_error err);

  /// Complete every entry with @p err, empty the map and refuse further
  /// inserts.  Returns how many entries were drained.
  std::size_t fail_all(const bridge_error& err);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool closed() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<internal_id_t, pending_request> pending_;
  internal_id_t last_id_{0};
  std::optional<bridge_error> closed_reason_;
};

/** @brief Rewrites ids between callers and the child.
 *
 * Callers pick their own ids and two of them may well both send @c 1, so
 * the child only ever sees ids allocated by the table.
 */
class id_remapper {
 public:
  struct remapped {
    internal_id_t internal_id;
    json::value client_id;
    std::future<outcome> completion;
  };

  explicit id_remapper(correlation_table& table) : table_{&table} {}

  /// Register @p msg in the table and replace its id with the internal one.
  std::expected<remapped, bridge_error> remap(json::object& msg);

  /// Stamp @p client_id back onto a response from the child.
  static void restore(json::object& response, const json::value& client_id);

  /// The internal id a child message refers to, if it carries one.
  static std::optional<internal_id_t> internal_id_of(const json::object& msg);

 private:
  correlation_table* table_;
};

}  // namespace rpcbridge
