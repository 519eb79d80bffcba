#include <catch2/catch_test_macros.hpp>
#include <nostr/metadata.hpp>

TEST_CASE("metadata serialization omits absent fields", "[nostr][metadata]")
{
  const tidepool::nostr::metadata profile{ .name = "alice", .about = "hi" };

  REQUIRE(profile.serialize() == R"({"about":"hi","name":"alice"})");
  REQUIRE(tidepool::nostr::metadata{}.serialize() == "{}");
}

TEST_CASE("metadata parsing", "[nostr][metadata]")
{
  SECTION("known fields are read and unknown keys ignored")
  {
    auto parsed = tidepool::nostr::metadata::deserialize(
      R"({"name":"bob","lud16":"bob@example.com","banner":"https://example.com/b.png","display_name":null})");

    REQUIRE(parsed.has_value());
    CHECK(parsed->name == "bob");
    CHECK(parsed->lud16 == "bob@example.com");
    CHECK_FALSE(parsed->display_name.has_value());
    CHECK_FALSE(parsed->about.has_value());
  }

  SECTION("a non-object is rejected") { REQUIRE_FALSE(tidepool::nostr::metadata::deserialize("[1,2]").has_value()); }

  SECTION("a known field with the wrong type is rejected")
  {
    REQUIRE_FALSE(tidepool::nostr::metadata::deserialize(R"({"name":42})").has_value());
  }

  SECTION("invalid JSON is rejected") { REQUIRE_FALSE(tidepool::nostr::metadata::deserialize("{").has_value()); }
}
