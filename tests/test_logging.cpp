/**
 * @file test_logging.cpp
 * @brief Tests for wizctl_logging.hpp: level filtering and sinks.
 */

#include <catch2/catch_test_macros.hpp>
#include "wizctl/logging/wizctl_logging.hpp"

#include <string>
#include <utility>
#include <vector>

using wizctl::logging::CallbackLogger;
using wizctl::logging::LogLevel;

namespace {

struct Recorded {
  std::vector<std::pair<LogLevel, std::string>> entries;

  CallbackLogger logger(LogLevel max_level) {
    return CallbackLogger(max_level, [this](LogLevel level, const std::string& message) { entries.emplace_back(level, message); });
  }
};

int g_evaluations = 0;

int counted() {
  ++g_evaluations;
  return 42;
}

}  // namespace

TEST_CASE("logging - level names", "[logging]") {
  REQUIRE(std::string(wizctl::logging::get_log_level_name(LogLevel::Error)) == "ERROR");
  REQUIRE(std::string(wizctl::logging::get_log_level_name(LogLevel::Warning)) == "WARNING");
  REQUIRE(std::string(wizctl::logging::get_log_level_name(LogLevel::Trace)) == "TRACE");
}

TEST_CASE("logging - callback logger filters by level", "[logging]") {
  Recorded recorded;
  auto logger = recorded.logger(LogLevel::Info);

  WIZCTL_LOG_ERROR(logger, "error " << 1);
  WIZCTL_LOG_INFO(logger, "info " << 2);
  WIZCTL_LOG_DEBUG(logger, "debug " << 3);
  WIZCTL_LOG_TRACE(logger, "trace " << 4);

  REQUIRE(recorded.entries.size() == 2);
  REQUIRE(recorded.entries[0].first == LogLevel::Error);
  REQUIRE(recorded.entries[1].first == LogLevel::Info);
  REQUIRE(recorded.entries[1].second.find("info 2") != std::string::npos);
}

TEST_CASE("logging - messages are prefixed with the calling function", "[logging]") {
  Recorded recorded;
  auto logger = recorded.logger(LogLevel::Trace);

  WIZCTL_LOG_WARNING(logger, "careful");

  REQUIRE(recorded.entries.size() == 1);
  REQUIRE(recorded.entries[0].second.find(": careful") != std::string::npos);
}

TEST_CASE("logging - rejected messages are never formatted", "[logging]") {
  g_evaluations = 0;
  auto& logger  = wizctl::logging::null_logger();
  WIZCTL_LOG_ERROR(logger, "value " << counted());
  REQUIRE(g_evaluations == 0);

  Recorded recorded;
  auto accepting = recorded.logger(LogLevel::Debug);
  WIZCTL_LOG_DEBUG(accepting, "value " << counted());
  REQUIRE(g_evaluations == 1);
}

TEST_CASE("logging - console logger level bounds", "[logging]") {
  wizctl::logging::ConsoleLogger logger(LogLevel::Warning);
  REQUIRE(logger.should_log(LogLevel::Error));
  REQUIRE(logger.should_log(LogLevel::Warning));
  REQUIRE_FALSE(logger.should_log(LogLevel::Info));

  logger.set_max_level(LogLevel::Trace);
  REQUIRE(logger.max_level() == LogLevel::Trace);
  REQUIRE(logger.should_log(LogLevel::Trace));
}

TEST_CASE("logging - callback logger without a callback logs nothing", "[logging]") {
  CallbackLogger logger(LogLevel::Trace, nullptr);
  REQUIRE_FALSE(logger.should_log(LogLevel::Error));
  logger.log(LogLevel::Error, "dropped");
}
