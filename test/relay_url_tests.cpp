#include <catch2/catch_test_macros.hpp>
#include <concepts/websocket_stream.hpp>
#include <core/errors.hpp>
#include <transport/websocket_stream.hpp>

static_assert(tidepool::concepts::websocket_stream<tidepool::transport::websocket_stream>);

TEST_CASE("parse_relay_url splits relay addresses", "[transport][url]")
{
  using tidepool::transport::parse_relay_url;
  using params_t = tidepool::transport::websocket_connection_params;

  SECTION("wss defaults to port 443 and path /")
  {
    REQUIRE(parse_relay_url("wss://relay.damus.io")
            == params_t{ .host = "relay.damus.io", .port = "443", .path = "/", .secure = true });
  }

  SECTION("ws defaults to port 80")
  {
    REQUIRE(parse_relay_url("ws://localhost")
            == params_t{ .host = "localhost", .port = "80", .path = "/", .secure = false });
  }

  SECTION("explicit port and path are kept")
  {
    REQUIRE(parse_relay_url("ws://127.0.0.1:7777/nostr/v1")
            == params_t{ .host = "127.0.0.1", .port = "7777", .path = "/nostr/v1", .secure = false });
  }
}

TEST_CASE("parse_relay_url rejects unusable addresses", "[transport][url]")
{
  using tidepool::transport::parse_relay_url;

  REQUIRE_THROWS_AS(parse_relay_url("https://relay.example.com"), tidepool::core::transport_error);
  REQUIRE_THROWS_AS(parse_relay_url("relay.example.com"), tidepool::core::transport_error);
  REQUIRE_THROWS_AS(parse_relay_url("wss://"), tidepool::core::transport_error);
  REQUIRE_THROWS_AS(parse_relay_url("wss://:443/"), tidepool::core::transport_error);
  REQUIRE_THROWS_AS(parse_relay_url("wss://relay.example.com:notaport"), tidepool::core::transport_error);
  REQUIRE_THROWS_AS(parse_relay_url("wss://relay.example.com:70000"), tidepool::core::transport_error);
}
