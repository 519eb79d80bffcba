#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nostr/event_builder.hpp>
#include <nostr/filter.hpp>
#include <nostr/keys.hpp>
#include <nostr/protocol.hpp>

namespace tidepool::nostr::test {

TEST_CASE("Event signing and validation benchmarks", "[benchmark][nostr]")
{
  const auto identity = keys::generate();
  const auto note = event_builder::text_note("benchmark note", { { "t", "bench" } }).created_at(1700000000).to_event(identity);

  SECTION("Signing")
  {
    BENCHMARK("Compute id and sign a text note")
    {
      return event_builder::text_note("benchmark note").created_at(1700000000).to_event(identity);
    };
  }

  SECTION("Validation")
  {
    BENCHMARK("Validate a signed text note") { return is_valid(note); };
  }

  SECTION("Wire parsing")
  {
    const auto frame =
      protocol::serialize(protocol::relay_message{ protocol::event_delivery{ .subscription_id = "bench", .event = note } });

    BENCHMARK("Parse an EVENT frame") { return protocol::parse_relay_message(frame); };
  }

  SECTION("Filter matching")
  {
    filter query;
    query.kind(kind::text_note).author(identity.public_key_hex()).tag("t", "bench").since_time(1600000000);

    BENCHMARK("Match a filter") { return query.matches(note); };
  }
}

}// namespace tidepool::nostr::test
