#include <catch2/catch_test_macros.hpp>
#include <crypto/bech32.hpp>
#include <crypto/hex.hpp>

#include <string>

namespace {
constexpr std::string_view sample_npub = "npub14f8usejl26twx0dhuxjh9cas7keav9vr0v8nvtwtrjqx3vycc76qqh9nsy";
constexpr std::string_view sample_npub_hex = "aa4fc8665f5696e33db7e1a572e3b0f5b3d615837b0f362dcb1c8068b098c7b4";
constexpr std::string_view sample_nsec = "nsec1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfk99";
constexpr std::string_view sample_nsec_hex = "9571a568a42b9e05646a349c783159b906b498119390df9a5a02667155128028";
}// namespace

SCENARIO("bech32 decodes nostr key strings", "[crypto][bech32]")
{
  GIVEN("a known npub")
  {
    WHEN("decoding it")
    {
      auto decoded = tidepool::crypto::bech32::decode(sample_npub);

      THEN("the prefix and payload are recovered")
      {
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->hrp == "npub");
        REQUIRE(tidepool::crypto::to_hex(decoded->data) == sample_npub_hex);
      }
    }

    WHEN("encoding the payload again")
    {
      auto payload = tidepool::crypto::from_hex(sample_npub_hex);
      REQUIRE(payload.has_value());

      THEN("the same string comes back")
      {
        REQUIRE(tidepool::crypto::bech32::encode("npub", *payload) == sample_npub);
      }
    }
  }

  GIVEN("a known nsec")
  {
    auto decoded = tidepool::crypto::bech32::decode(sample_nsec);

    THEN("the secret payload is recovered")
    {
      REQUIRE(decoded.has_value());
      REQUIRE(decoded->hrp == "nsec");
      REQUIRE(tidepool::crypto::to_hex(decoded->data) == sample_nsec_hex);
    }
  }
}

TEST_CASE("bech32 rejects corrupted strings", "[crypto][bech32]")
{
  SECTION("a flipped character breaks the checksum")
  {
    std::string corrupted{ sample_npub };
    corrupted[10] = corrupted[10] == 'q' ? 'p' : 'q';
    REQUIRE_FALSE(tidepool::crypto::bech32::decode(corrupted).has_value());
  }

  SECTION("mixed case is rejected")
  {
    std::string mixed{ sample_npub };
    mixed[5] = 'F';
    REQUIRE_FALSE(tidepool::crypto::bech32::decode(mixed).has_value());
  }

  SECTION("missing separator is rejected") { REQUIRE_FALSE(tidepool::crypto::bech32::decode("npubqqqqqq").has_value()); }

  SECTION("characters outside the alphabet are rejected")
  {
    REQUIRE_FALSE(tidepool::crypto::bech32::decode("npub1bbbbbbbbbbbbbb").has_value());
  }
}
