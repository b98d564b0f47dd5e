#include "doctest/doctest.h"
#include "trayctx/logger.hpp"
#include <thread>

using namespace trayctx;

DOCTEST_TEST_CASE("Log levels parse case-insensitively") {
  DOCTEST_REQUIRE(parse_log_level("trace") == LogLevel::TRACE);
  DOCTEST_REQUIRE(parse_log_level("DEBUG") == LogLevel::DEBUG);
  DOCTEST_REQUIRE(parse_log_level("Warning") == LogLevel::WARN);
  DOCTEST_REQUIRE(parse_log_level("error") == LogLevel::ERR);
  DOCTEST_REQUIRE(!parse_log_level("verbose"));
  DOCTEST_REQUIRE(!parse_log_level(""));
}

DOCTEST_TEST_CASE("Recent logs carry level and thread name") {
  Logger &log = Logger::get();
  log.set_quiet(true);
  log.set_level(LogLevel::DEBUG);

  std::thread worker([] {
    Logger::set_thread_name("worker");
    TRAYCTX_LOG_WARN("from worker");
  });
  worker.join();
  TRAYCTX_LOG_TRACE("below the threshold");
  TRAYCTX_LOG_DEBUG("from main");

  auto recent = log.get_recent_logs(2);
  DOCTEST_REQUIRE_EQ(recent.size(), 2u);
  DOCTEST_REQUIRE(recent[0].level == LogLevel::WARN);
  DOCTEST_REQUIRE_EQ(recent[0].thread, "worker");
  DOCTEST_REQUIRE_EQ(recent[0].message, "from worker");
  DOCTEST_REQUIRE(recent[1].level == LogLevel::DEBUG);
  DOCTEST_REQUIRE_EQ(recent[1].thread, "-");
  DOCTEST_REQUIRE(!recent[1].timestamp.empty());

  log.set_level(LogLevel::INFO);
  log.set_quiet(false);
}
