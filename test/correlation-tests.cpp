#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <chrono>
#include <limits>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "rpcbridge/correlation.hpp"

namespace json = boost::json;
using namespace std::chrono_literals;
using rpcbridge::correlation_table;
using rpcbridge::error_kind;
using rpcbridge::id_remapper;

TEST_CASE("table-resolve-once") {
  correlation_table table;
  auto reg = table.insert("client");
  REQUIRE(reg);
  CHECK(table.size() == 1);

  json::object response{{"result", 42}};
  CHECK(table.resolve(reg->internal_id, response));
  CHECK_FALSE(table.resolve(reg->internal_id, response));
  CHECK(table.size() == 0);

  auto got = reg->completion.get();
  REQUIRE(got);
  CHECK(got->at("result").as_int64() == 42);
}

TEST_CASE("table-abandon-loses-to-resolve") {
  correlation_table table;
  auto reg = table.insert(1);
  REQUIRE(reg);

  CHECK(table.resolve(reg->internal_id, json::object{{"result", "won"}}));
  CHECK_FALSE(table.abandon(
      reg->internal_id, {error_kind::request_timeout, "too slow", 10ms}));

  auto got = reg->completion.get();
  REQUIRE(got);
  CHECK(got->at("result") == "won");
}

TEST_CASE("table-fail-all-closes") {
  correlation_table table;
  auto a = table.insert(1);
  auto b = table.insert(2);
  REQUIRE(a);
  REQUIRE(b);

  CHECK(table.fail_all({error_kind::process_crashed, "gone"}) == 2);
  CHECK(table.size() == 0);
  CHECK(table.closed());

  for (auto* reg : {&*a, &*b}) {
    auto got = reg->completion.get();
    REQUIRE_FALSE(got);
    CHECK(got.error().kind == error_kind::process_crashed);
  }

  auto late = table.insert(3);
  REQUIRE_FALSE(late);
  CHECK(late.error().kind == error_kind::process_crashed);
  CHECK(table.fail_all({error_kind::process_not_running, "again"}) == 0);
}

TEST_CASE("table-unknown-ids") {
  correlation_table table;
  CHECK_FALSE(table.resolve(99, {}));
  CHECK_FALSE(table.abandon(99, {error_kind::request_timeout, "x"}));
}

TEST_CASE("remapper-rewrites-and-restores") {
  correlation_table table;
  id_remapper remapper{table};

  json::object a{{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", "1"}};
  json::object b{{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", "1"}};
  auto ra = remapper.remap(a);
  auto rb = remapper.remap(b);
  REQUIRE(ra);
  REQUIRE(rb);

  CHECK(a.at("id").as_int64() == ra->internal_id);
  CHECK(b.at("id").as_int64() == rb->internal_id);
  CHECK(ra->internal_id != rb->internal_id);
  CHECK(ra->client_id == "1");

  json::object response{{"jsonrpc", "2.0"}, {"id", rb->internal_id}};
  REQUIRE(id_remapper::internal_id_of(response) == rb->internal_id);
  id_remapper::restore(response, rb->client_id);
  CHECK(response.at("id") == "1");
}

TEST_CASE("remapper-internal-id-of") {
  CHECK(id_remapper::internal_id_of(json::object{{"id", 5}}) == 5);
  CHECK(id_remapper::internal_id_of(json::object{{"id", 5u}}) == 5);
  CHECK_FALSE(id_remapper::internal_id_of(json::object{{"id", "5"}}));
  CHECK_FALSE(id_remapper::internal_id_of(json::object{{"id", nullptr}}));
  CHECK_FALSE(id_remapper::internal_id_of(json::object{{"result", 1}}));
  CHECK_FALSE(id_remapper::internal_id_of(
      json::object{{"id", std::numeric_limits<uint64_t>::max()}}));
}

TEST_CASE("table-concurrent-inserts-get-unique-ids") {
  correlation_table table;
  constexpr int threads{8};
  constexpr int per_thread{200};

  std::mutex ids_mutex;
  std::set<rpcbridge::internal_id_t> ids;
  std::vector<std::thread> pool;
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&] {
      for (int i = 0; i < per_thread; ++i) {
        auto reg = table.insert(i);
        if (!reg) return;
        std::lock_guard lock{ids_mutex};
        ids.insert(reg->internal_id);
      }
    });
  }
  for (auto& t : pool) t.join();

  CHECK(ids.size() == threads * per_thread);
  CHECK(table.size() == threads * per_thread);
}
