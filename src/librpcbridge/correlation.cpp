#include "rpcbridge/correlation.hpp"

#include <limits>
#include <utility>
#include <vector>

namespace rpcbridge {

std::expected<correlation_table::registration, bridge_error>
correlation_table::insert(json::value client_id) {
  std::lock_guard lock{mutex_};
  if (closed_reason_) return std::unexpected{*closed_reason_};

  auto id = ++last_id_;
  auto it =
      pending_
          .emplace(id, pending_request{id, std::move(client_id), {}})
          .first;
  return registration{id, it->second.completion.get_future()};
}

bool correlation_table::resolve(internal_id_t id, json::object response) {
  std::promise<outcome> slot;
  {
    std::lock_guard lock{mutex_};
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;
    slot = std::move(it->second.completion);
    pending_.erase(it);
  }
  slot.set_value(std::move(response));
  return true;
}

bool correlation_table::abandon(internal_id_t id, bridge_error err) {
  std::promise<outcome> slot;
  {
    std::lock_guard lock{mutex_};
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;
    slot = std::move(it->second.completion);
    pending_.erase(it);
  }
  slot.set_value(std::unexpected{std::move(err)});
  return true;
}

std::size_t correlation_table::fail_all(const bridge_error& err) {
  std::vector<std::promise<outcome>> slots;
  {
    std::lock_guard lock{mutex_};
    if (!closed_reason_) closed_reason_ = err;
    slots.reserve(pending_.size());
    for (auto& [id, entry] : pending_)
      slots.push_back(std::move(entry.completion));
    pending_.clear();
  }
  for (auto& slot : slots) slot.set_value(std::unexpected{err});
  return slots.size();
}

std::size_t correlation_table::size() const {
  std::lock_guard lock{mutex_};
  return pending_.size();
}

bool correlation_table::closed() const {
  std::lock_guard lock{mutex_};
  return closed_reason_.has_value();
}

std::expected<id_remapper::remapped, bridge_error> id_remapper::remap(
    json::object& msg) {
  json::value client_id{nullptr};
  if (auto it = msg.find("id"); it != msg.end()) client_id = it->value();

  auto reg = table_->insert(client_id);
  if (!reg) return std::unexpected{reg.error()};

  msg["id"] = reg->internal_id;
  return remapped{
    reg->internal_id, std::move(client_id), std::move(reg->completion)};
}

void id_remapper::restore(
    json::object& response, const json::value& client_id) {
  response["id"] = client_id;
}

std::optional<internal_id_t> id_remapper::internal_id_of(
    const json::object& msg) {
  auto it = msg.find("id");
  if (it == msg.end()) return std::nullopt;
  const auto& id = it->value();
  if (auto* i = id.if_int64()) return *i;
  if (auto* u = id.if_uint64();
      u && *u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    return static_cast<internal_id_t>(*u);
  return std::nullopt;
}

}  // namespace rpcbridge
