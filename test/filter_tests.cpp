#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <nostr/filter.hpp>

#include <stdexcept>

namespace {
auto make_event(std::string pubkey, tidepool::nostr::kind kind, std::uint64_t created_at) -> tidepool::nostr::event
{
  return { .id = std::string(64, 'e'),
    .pubkey = std::move(pubkey),
    .created_at = created_at,
    .kind = kind,
    .tags = {},
    .content = "",
    .sig = std::string(128, '0') };
}

const std::string alice = std::string(64, 'a');
const std::string bob = std::string(64, 'b');
}// namespace

SCENARIO("a kind and author filter selects only events matching both", "[nostr][filter]")
{
  GIVEN("a filter for text notes by alice and three candidate notes")
  {
    tidepool::nostr::filter by_alice;
    by_alice.kind(tidepool::nostr::kind::text_note).author(alice);

    const auto bob_note = make_event(bob, tidepool::nostr::kind::text_note, 1);
    const auto other_bob_note = make_event(bob, tidepool::nostr::kind::text_note, 2);
    const auto alice_note = make_event(alice, tidepool::nostr::kind::text_note, 3);

    WHEN("evaluating each candidate")
    {
      std::vector<tidepool::nostr::event> selected;
      for (const auto &candidate : { bob_note, other_bob_note, alice_note }) {
        if (by_alice.matches(candidate)) { selected.push_back(candidate); }
      }

      THEN("exactly alice's note is selected")
      {
        REQUIRE(selected.size() == 1);
        REQUIRE(selected.front() == alice_note);
      }
    }
  }
}

TEST_CASE("filter constraint semantics", "[nostr][filter]")
{
  auto evt = make_event(alice, tidepool::nostr::kind::reaction, 100);
  evt.tags = { { "e", "target" }, { "p", bob }, { "x" } };

  SECTION("an empty filter matches everything") { REQUIRE(tidepool::nostr::filter{}.matches(evt)); }

  SECTION("time bounds are inclusive")
  {
    REQUIRE(tidepool::nostr::filter{}.since_time(100).matches(evt));
    REQUIRE(tidepool::nostr::filter{}.until_time(100).matches(evt));
    REQUIRE_FALSE(tidepool::nostr::filter{}.since_time(101).matches(evt));
    REQUIRE_FALSE(tidepool::nostr::filter{}.until_time(99).matches(evt));
  }

  SECTION("tag constraints look at the first value of matching tags")
  {
    REQUIRE(tidepool::nostr::filter{}.tag("e", "target").matches(evt));
    REQUIRE(tidepool::nostr::filter{}.tag("p", "nobody").tag("p", bob).matches(evt));
    REQUIRE_FALSE(tidepool::nostr::filter{}.tag("e", "other").matches(evt));
    REQUIRE_FALSE(tidepool::nostr::filter{}.tag("x", "").matches(evt));
  }

  SECTION("different tag names must all match")
  {
    REQUIRE(tidepool::nostr::filter{}.tag("e", "target").tag("p", bob).matches(evt));
    REQUIRE_FALSE(tidepool::nostr::filter{}.tag("e", "target").tag("t", "news").matches(evt));
  }

  SECTION("limit does not affect matching") { REQUIRE(tidepool::nostr::filter{}.limit_to(0).matches(evt)); }

  SECTION("an empty id list matches nothing")
  {
    tidepool::nostr::filter none;
    none.ids.emplace();
    REQUIRE_FALSE(none.matches(evt));
  }

  SECTION("filters of one subscription combine by OR")
  {
    std::vector<tidepool::nostr::filter> filters(2);
    filters[0].kind(tidepool::nostr::kind::text_note);
    filters[1].author(alice);
    REQUIRE(tidepool::nostr::matches_any(filters, evt));
    filters[1].authors = std::vector<std::string>{ bob };
    REQUIRE_FALSE(tidepool::nostr::matches_any(filters, evt));
  }
}

TEST_CASE("filter validation", "[nostr][filter]")
{
  REQUIRE_NOTHROW(tidepool::nostr::filter{}.since_time(5).until_time(5).validate());
  REQUIRE_THROWS_AS(tidepool::nostr::filter{}.since_time(6).until_time(5).validate(), std::invalid_argument);

  tidepool::nostr::filter empty_values;
  empty_values.tags["e"] = {};
  REQUIRE_THROWS_AS(empty_values.validate(), std::invalid_argument);

  tidepool::nostr::filter empty_name;
  empty_name.tags[""] = { "v" };
  REQUIRE_THROWS_AS(empty_name.validate(), std::invalid_argument);
}

TEST_CASE("filter wire form", "[nostr][filter]")
{
  SECTION("to_json emits only present constraints with # tag keys")
  {
    tidepool::nostr::filter query;
    query.kind(tidepool::nostr::kind::text_note).tag("t", "nostr").limit_to(20);

    REQUIRE(query.to_json() == nlohmann::json::parse(R"({"kinds":[1],"#t":["nostr"],"limit":20})"));
  }

  SECTION("from_json reads every constraint and ignores unknown keys")
  {
    auto parsed = tidepool::nostr::filter::from_json(nlohmann::json::parse(
      R"({"ids":["x"],"authors":["y"],"kinds":[0,7],"#e":["z"],"since":1,"until":2,"limit":3,"search":"ignored"})"));

    CHECK(parsed.ids == std::vector<std::string>{ "x" });
    CHECK(parsed.authors == std::vector<std::string>{ "y" });
    CHECK(parsed.kinds
          == std::vector<tidepool::nostr::kind>{ tidepool::nostr::kind::set_metadata, tidepool::nostr::kind::reaction });
    CHECK(parsed.tags.at("e") == std::vector<std::string>{ "z" });
    CHECK(parsed.since == 1U);
    CHECK(parsed.until == 2U);
    CHECK(parsed.limit == 3U);
    CHECK(tidepool::nostr::filter::from_json(parsed.to_json()) == parsed);
  }

  SECTION("wrongly typed values are rejected")
  {
    REQUIRE_THROWS_AS(tidepool::nostr::filter::from_json(nlohmann::json::parse(R"({"kinds":"1"})")), std::invalid_argument);
    REQUIRE_THROWS_AS(tidepool::nostr::filter::from_json(nlohmann::json::parse(R"({"since":-4})")), std::invalid_argument);
    REQUIRE_THROWS_AS(tidepool::nostr::filter::from_json(nlohmann::json::parse("[]")), std::invalid_argument);
  }
}
