/**
 * @file test_udp_transport.cpp
 * @brief Tests for udp_transport.hpp: socket acquisition, addressing and one round trip.
 */

#include <catch2/catch_test_macros.hpp>
#include "fake_device.hpp"
#include "wizctl/errors/wiz_errors.hpp"
#include "wizctl/net/network_utils.hpp"
#include "wizctl/net/udp_transport.hpp"

#include <boost/asio/error.hpp>

#include <memory>
#include <string>

using wizctl::testing::FakeDevice;

TEST_CASE("udp_transport - make_endpoint parses IPv4", "[udp_transport]") {
  auto endpoint = wizctl::make_endpoint("192.168.1.44", 38899);
  REQUIRE(endpoint.address().to_string() == "192.168.1.44");
  REQUIRE(endpoint.port() == 38899);
}

TEST_CASE("udp_transport - make_endpoint rejects garbage", "[udp_transport]") {
  REQUIRE_THROWS_AS(wizctl::make_endpoint("not-an-ip", 38899), wizctl::ArgumentError);
  REQUIRE_THROWS_AS(wizctl::make_endpoint("256.1.1.1", 38899), wizctl::ArgumentError);
  REQUIRE_THROWS_AS(wizctl::make_endpoint("", 38899), wizctl::ArgumentError);
}

TEST_CASE("udp_transport - binds an ephemeral port and closes", "[udp_transport]") {
  boost::asio::io_context io_context;
  wizctl::UdpTransport transport(io_context, wizctl::logging::null_logger(), true);
  REQUIRE(transport.is_open());
  REQUIRE(transport.local_port() != 0);

  transport.close();
  REQUIRE_FALSE(transport.is_open());
  transport.close();
}

TEST_CASE("udp_transport - binding to a foreign address is a ConnectionError", "[udp_transport]") {
  boost::asio::io_context io_context;
  // TEST-NET-1, never assigned to a local interface
  auto foreign = boost::asio::ip::make_address_v4("192.0.2.1");
  REQUIRE_THROWS_AS(wizctl::UdpTransport(io_context, wizctl::logging::null_logger(), false, foreign), wizctl::ConnectionError);
}

TEST_CASE("udp_transport - send and receive a datagram", "[udp_transport]") {
  FakeDevice device(FakeDevice::raw(R"({"result":{"success":true}})"));

  boost::asio::io_context io_context;
  wizctl::UdpTransport transport(io_context, wizctl::logging::null_logger());

  boost::system::error_code send_error;
  std::size_t sent = 0;
  boost::system::error_code receive_error;
  wizctl::Datagram received;

  auto payload = std::make_shared<const std::string>(R"({"method":"getPilot","params":{}})");
  transport.async_receive([&](const boost::system::error_code& error_code, const wizctl::Datagram& datagram) {
    receive_error = error_code;
    received      = datagram;
  });
  transport.async_send_to(payload, wizctl::make_endpoint("127.0.0.1", device.port()),
                          [&](const boost::system::error_code& error_code, std::size_t bytes) {
                            send_error = error_code;
                            sent       = bytes;
                          });

  io_context.run_for(std::chrono::seconds(2));

  REQUIRE_FALSE(send_error);
  REQUIRE(sent == payload->size());
  REQUIRE_FALSE(receive_error);
  REQUIRE(received.payload == R"({"result":{"success":true}})");
  REQUIRE(received.sender.port() == device.port());
  REQUIRE(device.requests().front() == *payload);
}

TEST_CASE("udp_transport - cancel aborts a pending receive", "[udp_transport]") {
  boost::asio::io_context io_context;
  wizctl::UdpTransport transport(io_context, wizctl::logging::null_logger());

  boost::system::error_code receive_error;
  transport.async_receive([&](const boost::system::error_code& error_code, const wizctl::Datagram&) { receive_error = error_code; });
  transport.cancel();
  io_context.run_for(std::chrono::seconds(1));

  REQUIRE(receive_error == boost::asio::error::operation_aborted);
}

TEST_CASE("network_utils - listed interfaces are IPv4, up and not loopback", "[network_utils]") {
  for (const auto& network_interface : wizctl::list_ipv4_interfaces()) {
    REQUIRE_FALSE(network_interface.name.empty());
    REQUIRE_FALSE(network_interface.address.is_loopback());
    REQUIRE_FALSE(network_interface.address.is_unspecified());
  }
}
