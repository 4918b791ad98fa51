/**
 * @file test_exchange.cpp
 * @brief Tests for exchange.hpp: per-attempt timeout, retries and reply classification.
 */

#include <catch2/catch_test_macros.hpp>
#include "fake_device.hpp"
#include "wizctl/errors/wiz_errors.hpp"
#include "wizctl/exchange/exchange.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using nlohmann::json;
using wizctl::RetryPolicy;
using wizctl::testing::FakeDevice;
using wizctl::testing::elapsed_ms;

namespace {

const json kGetPilot = wizctl::protocol::make_request(wizctl::protocol::method_get_pilot);

const json kPilotReply = {{"method", "getPilot"}, {"env", "pro"}, {"result", {{"mac", "a8bb50aabbcc"}, {"state", true}}}};

wizctl::Reply send_to(const FakeDevice& device, std::chrono::milliseconds timeout, const RetryPolicy& retry,
                      const json& message = kGetPilot) {
  return wizctl::send("127.0.0.1", device.port(), message, timeout, retry);
}

}  // namespace

// ============================================================================
// 1. Success
// ============================================================================

TEST_CASE("exchange - immediate reply succeeds on the first attempt", "[exchange]") {
  FakeDevice device(FakeDevice::always(kPilotReply));

  auto start = std::chrono::steady_clock::now();
  auto reply = send_to(device, 2s, RetryPolicy::fixed(3, 200ms));

  REQUIRE(elapsed_ms(start) < 1000);
  REQUIRE(reply.body == kPilotReply);
  REQUIRE(reply.result()["state"] == true);
  REQUIRE(reply.sender.port() == device.port());
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - request is sent as serialized JSON", "[exchange]") {
  FakeDevice device(FakeDevice::always({{"method", "setPilot"}, {"result", {{"success", true}}}}));

  auto message = wizctl::protocol::make_request("setPilot", {{"state", true}, {"dimming", 55}});
  send_to(device, 1s, RetryPolicy::disabled(), message);

  auto requests = device.requests();
  REQUIRE(requests.size() == 1);
  REQUIRE(json::parse(requests.front()) == message);
}

TEST_CASE("exchange - silence is retried until the device answers", "[exchange]") {
  FakeDevice device(FakeDevice::after(2, kPilotReply));

  auto reply = send_to(device, 150ms, RetryPolicy::fixed(4, 50ms));

  REQUIRE(reply.result()["mac"] == "a8bb50aabbcc");
  REQUIRE(device.request_count() == 3);
}

TEST_CASE("exchange - echoed parameters come back unchanged", "[exchange]") {
  FakeDevice device([](const std::string& request, std::size_t) {
    auto message = json::parse(request);
    json reply   = {{"method", message["method"]}, {"result", message["params"]}};
    return std::vector<std::string>{reply.dump()};
  });

  json params = {{"state", true}, {"dimming", 75}, {"r", 255}, {"g", 0}, {"b", 128}, {"c", 0}, {"w", 10},
                 {"temp", 2700}, {"sceneId", 12}, {"speed", 100}};
  auto reply  = send_to(device, 500ms, RetryPolicy::disabled(), wizctl::protocol::make_request("setPilot", params));

  REQUIRE(reply.result() == params);
  REQUIRE(reply.body["method"] == "setPilot");
}

// ============================================================================
// 2. Timeout
// ============================================================================

TEST_CASE("exchange - no retries means exactly one attempt", "[exchange][timeout]") {
  FakeDevice device(FakeDevice::silent());

  auto start = std::chrono::steady_clock::now();
  try {
    send_to(device, 200ms, RetryPolicy::disabled());
    FAIL("expected TimeoutError");
  } catch (const wizctl::TimeoutError& error) {
    REQUIRE(error.attempts() == 1);
    REQUIRE(error.timeout() == 200ms);
    REQUIRE(error.address() == "127.0.0.1");
  }

  auto elapsed = elapsed_ms(start);
  REQUIRE(elapsed >= 200);
  REQUIRE(elapsed < 1200);
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - exhausted retries report every attempt", "[exchange][timeout]") {
  FakeDevice device(FakeDevice::silent());

  auto start = std::chrono::steady_clock::now();
  try {
    send_to(device, 100ms, RetryPolicy::fixed(2, 50ms));
    FAIL("expected TimeoutError");
  } catch (const wizctl::TimeoutError& error) {
    REQUIRE(error.attempts() == 3);
  }

  // 3 * 100ms timeout + 2 * 50ms interval
  REQUIRE(elapsed_ms(start) >= 400);
  REQUIRE(device.request_count() == 3);
}

TEST_CASE("exchange - exponential spacing grows between attempts", "[exchange][timeout]") {
  FakeDevice device(FakeDevice::silent());

  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(send_to(device, 50ms, RetryPolicy::exponential(2, 100ms, 1s)), wizctl::TimeoutError);

  // 3 * 50ms timeout + 100ms + 200ms
  REQUIRE(elapsed_ms(start) >= 450);
  REQUIRE(device.request_count() == 3);
}

TEST_CASE("exchange - stopped context is settled as timeout by take_result", "[exchange][timeout]") {
  FakeDevice device(FakeDevice::silent());

  boost::asio::io_context io_context;
  wizctl::Exchange exchange(io_context, wizctl::make_endpoint("127.0.0.1", device.port()), kGetPilot, 2s, RetryPolicy::fixed(3, 1s));
  REQUIRE(exchange.async_start());

  io_context.run_for(150ms);
  REQUIRE_FALSE(exchange.is_settled());
  REQUIRE(exchange.attempts() == 1);

  try {
    exchange.take_result();
    FAIL("expected TimeoutError");
  } catch (const wizctl::TimeoutError& error) {
    REQUIRE(error.attempts() == 1);
  }
  REQUIRE(exchange.is_settled());
}

TEST_CASE("exchange - huge timeouts wait instead of expiring at once", "[exchange][timeout]") {
  FakeDevice device(FakeDevice::silent());

  boost::asio::io_context io_context;
  wizctl::Exchange exchange(io_context, wizctl::make_endpoint("127.0.0.1", device.port()), kGetPilot,
                            std::chrono::milliseconds(10000000000000), RetryPolicy(2, wizctl::RetryStrategy::exponential, 1ms));
  exchange.async_start();
  io_context.run_for(300ms);

  REQUIRE_FALSE(exchange.is_settled());
  REQUIRE(exchange.attempts() == 1);
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - saturated retry interval is not retried at once", "[exchange][timeout]") {
  FakeDevice device(FakeDevice::silent());

  boost::asio::io_context io_context;
  wizctl::Exchange exchange(io_context, wizctl::make_endpoint("127.0.0.1", device.port()), kGetPilot, 50ms,
                            RetryPolicy::fixed(3, RetryPolicy::duration::max()));
  exchange.async_start();
  io_context.run_for(400ms);

  REQUIRE_FALSE(exchange.is_settled());
  REQUIRE(exchange.attempts() == 1);
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - worst case duration covers every attempt and interval", "[exchange]") {
  boost::asio::io_context io_context;
  wizctl::Exchange exchange(io_context, wizctl::make_endpoint("127.0.0.1", 9), kGetPilot, 1s,
                            RetryPolicy::exponential(3, 500ms, 3s));
  // 4 * 1s + 500 + 1000 + 2000
  REQUIRE(exchange.worst_case_duration() == 7500ms);
}

// ============================================================================
// 3. Error replies
// ============================================================================

TEST_CASE("exchange - method not found fails at once without retrying", "[exchange][error]") {
  FakeDevice device(FakeDevice::always({{"method", "getModelConfig"}, {"error", {{"code", -32601}, {"message", "Method not found"}}}}));

  try {
    send_to(device, 500ms, RetryPolicy::fixed(3, 100ms), wizctl::protocol::make_request("getModelConfig"));
    FAIL("expected MethodNotFoundError");
  } catch (const wizctl::MethodNotFoundError& error) {
    REQUIRE(error.method() == "getModelConfig");
    REQUIRE(error.address() == "127.0.0.1");
  }
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - other error codes are response errors with the code", "[exchange][error]") {
  FakeDevice device(FakeDevice::always({{"error", {{"code", -32602}, {"message", "Invalid params"}}}}));

  try {
    send_to(device, 500ms, RetryPolicy::fixed(3, 100ms));
    FAIL("expected ResponseError");
  } catch (const wizctl::ResponseError& error) {
    REQUIRE(error.error_code().has_value());
    REQUIRE(*error.error_code() == -32602);
    REQUIRE(std::string(error.what()).find("Invalid params") != std::string::npos);
  }
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - error without code or message", "[exchange][error]") {
  FakeDevice device(FakeDevice::always({{"error", "boom"}}));

  try {
    send_to(device, 500ms, RetryPolicy::disabled());
    FAIL("expected ResponseError");
  } catch (const wizctl::ResponseError& error) {
    REQUIRE_FALSE(error.error_code().has_value());
    REQUIRE(std::string(error.what()).find("Unknown error") != std::string::npos);
  }
}

TEST_CASE("exchange - unparsable reply keeps the raw bytes", "[exchange][error]") {
  FakeDevice device(FakeDevice::raw("{not json"));

  try {
    send_to(device, 500ms, RetryPolicy::fixed(2, 100ms));
    FAIL("expected ResponseError");
  } catch (const wizctl::ResponseError& error) {
    REQUIRE(error.raw_response() == "{not json");
    REQUIRE_FALSE(error.error_code().has_value());
  }
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - non-object JSON is a response error", "[exchange][error]") {
  FakeDevice device(FakeDevice::raw("[1,2,3]"));
  REQUIRE_THROWS_AS(send_to(device, 500ms, RetryPolicy::disabled()), wizctl::ResponseError);
}

TEST_CASE("exchange - out-of-range error code is not mistaken for method not found", "[exchange][error]") {
  // 4294934695 truncated to 32 bits would read as -32601.
  FakeDevice device(FakeDevice::raw(R"({"error":{"code":4294934695,"message":"odd"}})"));

  try {
    send_to(device, 500ms, RetryPolicy::disabled());
    FAIL("expected ResponseError");
  } catch (const wizctl::MethodNotFoundError&) {
    FAIL("code was truncated");
  } catch (const wizctl::ResponseError& error) {
    REQUIRE_FALSE(error.error_code().has_value());
    REQUIRE(error.raw_response().find("4294934695") != std::string::npos);
  }
}

TEST_CASE("exchange - negative out-of-range error code", "[exchange][error]") {
  FakeDevice device(FakeDevice::raw(R"({"error":{"code":-4294999897}})"));

  try {
    send_to(device, 500ms, RetryPolicy::disabled());
    FAIL("expected ResponseError");
  } catch (const wizctl::MethodNotFoundError&) {
    FAIL("code was truncated");
  } catch (const wizctl::ResponseError& error) {
    REQUIRE_FALSE(error.error_code().has_value());
  }
}

TEST_CASE("exchange - first reply wins over a later success", "[exchange][error]") {
  FakeDevice device(FakeDevice::sequence({json{{"error", {{"code", -32602}, {"message", "Invalid params"}}}}.dump(), kPilotReply.dump()}));

  try {
    send_to(device, 500ms, RetryPolicy::fixed(2, 100ms));
    FAIL("expected ResponseError");
  } catch (const wizctl::ResponseError& error) {
    REQUIRE(error.error_code() == -32602);
  }
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - first reply wins over a later error", "[exchange]") {
  FakeDevice device(FakeDevice::sequence({kPilotReply.dump(), json{{"error", {{"code", -32601}, {"message", "Method not found"}}}}.dump()}));

  auto reply = send_to(device, 500ms, RetryPolicy::fixed(2, 100ms));
  REQUIRE(reply.body == kPilotReply);
  REQUIRE(device.request_count() == 1);
}

TEST_CASE("exchange - invalid address is rejected before sending", "[exchange][error]") {
  REQUIRE_THROWS_AS(wizctl::send("light.local", 38899, kGetPilot, 100ms, RetryPolicy::disabled()), wizctl::ArgumentError);
}

// ============================================================================
// 4. Lifecycle
// ============================================================================

TEST_CASE("exchange - completion is posted once and start is single-shot", "[exchange]") {
  FakeDevice device(FakeDevice::always(kPilotReply));

  boost::asio::io_context io_context;
  wizctl::Exchange exchange(io_context, wizctl::make_endpoint("127.0.0.1", device.port()), kGetPilot, 1s, RetryPolicy::disabled());

  int completions = 0;
  REQUIRE(exchange.async_start([&completions]() { ++completions; }));
  REQUIRE_FALSE(exchange.async_start());

  io_context.run_for(3s);

  REQUIRE(completions == 1);
  REQUIRE(exchange.is_settled());
  REQUIRE_FALSE(exchange.async_start());
  REQUIRE(exchange.take_result().body == kPilotReply);
}

TEST_CASE("exchange - concurrent sends on separate threads are independent", "[exchange]") {
  FakeDevice answering(FakeDevice::always(kPilotReply));
  FakeDevice silent(FakeDevice::silent());

  bool answered  = false;
  bool timed_out = false;
  std::thread first([&]() { answered = send_to(answering, 500ms, RetryPolicy::disabled()).body == kPilotReply; });
  std::thread second([&]() {
    try {
      send_to(silent, 200ms, RetryPolicy::disabled());
    } catch (const wizctl::TimeoutError&) {
      timed_out = true;
    }
  });
  first.join();
  second.join();

  REQUIRE(answered);
  REQUIRE(timed_out);
}
