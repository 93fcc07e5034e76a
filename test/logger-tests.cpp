#include <doctest/doctest.h>

#include <source_location>
#include <string>
#include <thread>

#include "../src/librpcbridge/logger.hpp"

namespace logger = rpcbridge::logger;

TEST_CASE("logger-level-filter") {
  auto saved = logger::global_level;

  logger::set_level(logger::level::warning);
  CHECK(logger::enabled(logger::level::error));
  CHECK(logger::enabled(logger::level::warning));
  CHECK_FALSE(logger::enabled(logger::level::info));

  logger::set_level(logger::level::trace);
  CHECK(logger::enabled(logger::level::trace));

  logger::set_level(saved);
}

TEST_CASE("logger-line-names-thread") {
  auto here = std::source_location::current();
  auto line = logger::format_line(logger::level::info, here, "hello");

  CHECK(line.find("[main] logger-tests.cpp:") != std::string::npos);
  CHECK(line.ends_with("INFO: hello"));

  std::string from_reader;
  std::thread{[&] {
    logger::set_thread_tag("stdout");
    from_reader = logger::format_line(logger::level::warning, here, "x");
  }}.join();
  CHECK(from_reader.find("[stdout]") != std::string::npos);

  // The tag is per thread.
  CHECK(logger::thread_tag == "main");
}
