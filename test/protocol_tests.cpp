#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <nostr/event_builder.hpp>
#include <nostr/keys.hpp>
#include <nostr/protocol.hpp>

#include <stdexcept>

namespace protocol = tidepool::nostr::protocol;

TEST_CASE("protocol serializes client messages", "[nostr][protocol]")
{
  SECTION("REQ lists every filter after the id")
  {
    tidepool::nostr::filter notes;
    notes.kind(tidepool::nostr::kind::text_note);
    tidepool::nostr::filter limited;
    limited.limit_to(5);

    const protocol::client_message message = protocol::req{ .subscription_id = "feed", .filters = { notes, limited } };

    REQUIRE(protocol::serialize(message) == R"(["REQ","feed",{"kinds":[1]},{"limit":5}])");
    REQUIRE(protocol::message_type(message) == "REQ");
  }

  SECTION("CLOSE")
  {
    REQUIRE(protocol::serialize(protocol::client_message{ protocol::close{ .subscription_id = "feed" } })
            == R"(["CLOSE","feed"])");
  }

  SECTION("EVENT carries the event object")
  {
    const auto identity = tidepool::nostr::keys::generate();
    const auto evt = tidepool::nostr::event_builder::text_note("hi").to_event(identity);
    const protocol::client_message message = protocol::event_message{ .event = evt };

    REQUIRE(protocol::parse_client_message(protocol::serialize(message)) == message);
  }
}

TEST_CASE("protocol parses relay messages", "[nostr][protocol]")
{
  const auto identity = tidepool::nostr::keys::generate();
  const auto evt = tidepool::nostr::event_builder::text_note("hi").to_event(identity);

  SECTION("EVENT")
  {
    const auto frame = protocol::serialize(protocol::relay_message{ protocol::event_delivery{ .subscription_id = "s1", .event = evt } });
    const auto parsed = protocol::parse_relay_message(frame);

    REQUIRE(std::holds_alternative<protocol::event_delivery>(parsed));
    CHECK(std::get<protocol::event_delivery>(parsed).subscription_id == "s1");
    CHECK(std::get<protocol::event_delivery>(parsed).event == evt);
  }

  SECTION("OK with and without a message")
  {
    const auto with_message = protocol::parse_relay_message(R"(["OK","abc",false,"blocked: spam"])");
    const auto without_message = protocol::parse_relay_message(R"(["OK","abc",true])");

    CHECK(std::get<protocol::ok>(with_message) == protocol::ok{ .event_id = "abc", .accepted = false, .message = "blocked: spam" });
    CHECK(std::get<protocol::ok>(without_message) == protocol::ok{ .event_id = "abc", .accepted = true, .message = "" });
  }

  SECTION("EOSE, NOTICE, AUTH and CLOSED")
  {
    CHECK(std::get<protocol::eose>(protocol::parse_relay_message(R"(["EOSE","s1"])")).subscription_id == "s1");
    CHECK(std::get<protocol::notice>(protocol::parse_relay_message(R"(["NOTICE","slow down"])")).message == "slow down");
    CHECK(std::get<protocol::auth>(protocol::parse_relay_message(R"(["AUTH","challenge"])")).challenge == "challenge");
    CHECK(std::get<protocol::closed>(protocol::parse_relay_message(R"(["CLOSED","s1","error: shutting down"])"))
          == protocol::closed{ .subscription_id = "s1", .message = "error: shutting down" });
    CHECK(protocol::message_type(protocol::parse_relay_message(R"(["CLOSED","s1"])")) == "CLOSED");
  }
}

TEST_CASE("protocol rejects malformed frames", "[nostr][protocol]")
{
  const auto rejects = [](std::string_view frame) {
    REQUIRE_THROWS_AS(protocol::parse_relay_message(frame), tidepool::core::protocol_error);
  };

  SECTION("not JSON") { rejects("hello"); }
  SECTION("not an array") { rejects(R"({"EVENT":1})"); }
  SECTION("empty array") { rejects("[]"); }
  SECTION("non-string type") { rejects("[1,2]"); }
  SECTION("unknown type") { rejects(R"(["PING"])"); }
  SECTION("EOSE with wrong arity") { rejects(R"(["EOSE","s1","extra"])"); }
  SECTION("EVENT without subscription id") { rejects(R"(["EVENT",{}])"); }
  SECTION("EVENT with malformed event") { rejects(R"(["EVENT","s1",{"id":1}])"); }
  SECTION("OK with non-boolean acceptance") { rejects(R"(["OK","abc","true",""])"); }
  SECTION("over-long subscription id") { rejects(R"(["EOSE",")" + std::string(65, 'x') + R"("])"); }
}

TEST_CASE("protocol parses client frames", "[nostr][protocol]")
{
  auto parsed = protocol::parse_client_message(R"(["REQ","sub",{"kinds":[1]},{"authors":["a"]}])");
  REQUIRE(std::holds_alternative<protocol::req>(parsed));
  CHECK(std::get<protocol::req>(parsed).filters.size() == 2);

  REQUIRE_THROWS_AS(protocol::parse_client_message(R"(["REQ","sub"])"), tidepool::core::protocol_error);
  REQUIRE_THROWS_AS(protocol::parse_client_message(R"(["REQ","sub",{"kinds":"x"}])"), tidepool::core::protocol_error);
  REQUIRE_THROWS_AS(protocol::parse_client_message(R"(["CLOSE"])"), tidepool::core::protocol_error);
}

TEST_CASE("subscription ids are 1 to 64 characters", "[nostr][protocol]")
{
  REQUIRE_NOTHROW(protocol::validate_subscription_id("a"));
  REQUIRE_NOTHROW(protocol::validate_subscription_id(std::string(64, 'a')));
  REQUIRE_THROWS_AS(protocol::validate_subscription_id(""), std::invalid_argument);
  REQUIRE_THROWS_AS(protocol::validate_subscription_id(std::string(65, 'a')), std::invalid_argument);
}
