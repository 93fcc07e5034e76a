#include <doctest/doctest.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <cstring>
#include <string>
#include <vector>

#include "rpcbridge/line_framer.hpp"

using rpcbridge::line_framer;

namespace {

// Hands out a fixed script of chunks, then EOF.
struct chunked_stream {
  std::vector<std::string> chunks;
  std::size_t next{0};

  std::size_t read_some(
      const boost::asio::mutable_buffer& buf, boost::system::error_code& ec) {
    if (next == chunks.size()) {
      ec = boost::asio::error::eof;
      return 0;
    }
    auto& chunk = chunks[next];
    auto n = std::min(chunk.size(), buf.size());
    std::memcpy(buf.data(), chunk.data(), n);
    if (n == chunk.size()) {
      ++next;
    } else {
      chunk.erase(0, n);
    }
    return n;
  }
};

std::vector<std::string> drain(line_framer& framer) {
  std::vector<std::string> lines;
  while (auto line = framer.next()) lines.push_back(*line);
  return lines;
}

}  // namespace

TEST_CASE("framer-split-across-chunks") {
  line_framer framer;
  framer.feed(R"({"id":1,"res)");
  CHECK_FALSE(framer.next());
  framer.feed("ult\":true}\n{\"id\"");
  auto first = framer.next();
  REQUIRE(first);
  CHECK(*first == R"({"id":1,"result":true})");
  CHECK_FALSE(framer.next());
  framer.feed(":2}\n");
  auto second = framer.next();
  REQUIRE(second);
  CHECK(*second == R"({"id":2})");
  CHECK(framer.buffered() == 0);
}

TEST_CASE("framer-many-lines-in-one-chunk") {
  line_framer framer;
  framer.feed("a\nb\r\n\n\nc\n");
  CHECK(drain(framer) == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("framer-unterminated-tail") {
  line_framer framer;
  framer.feed("a\nb");
  CHECK(drain(framer) == std::vector<std::string>{"a"});
  auto tail = framer.finish();
  REQUIRE(tail);
  CHECK(*tail == "b");
  CHECK_FALSE(framer.finish());
}

TEST_CASE("framer-overlong-lines-are-skipped") {
  line_framer framer{8};

  SUBCASE("arriving in one piece") {
    framer.feed("0123456789abc\nok\n");
    CHECK(drain(framer) == std::vector<std::string>{"ok"});
  }
  SUBCASE("arriving in pieces") {
    framer.feed("0123456789");
    CHECK_FALSE(framer.next());
    framer.feed("more and more");
    CHECK_FALSE(framer.next());
    framer.feed("end\nok\n");
    CHECK(drain(framer) == std::vector<std::string>{"ok"});
  }

  CHECK(framer.discarded() == 1);
}

TEST_CASE("reader-yields-lines-then-ends") {
  chunked_stream stream{{"{\"a\":1}\n{\"b\"", ":2}\n", "tail"}};
  rpcbridge::line_reader reader{stream};

  std::vector<std::string> lines;
  while (auto line = reader.next()) lines.push_back(*line);

  CHECK(lines == std::vector<std::string>{R"({"a":1})", R"({"b":2})", "tail"});
  CHECK(reader.error() == boost::asio::error::eof);
  CHECK_FALSE(reader.next());
}

TEST_CASE("reader-large-line-spanning-reads") {
  std::string big(20000, 'x');
  chunked_stream stream{{big + "\n"}};
  rpcbridge::line_reader reader{stream};

  auto line = reader.next();
  REQUIRE(line);
  CHECK(line->size() == big.size());
  CHECK_FALSE(reader.next());
}
