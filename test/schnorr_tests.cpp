#include <catch2/catch_test_macros.hpp>
#include <crypto/hex.hpp>
#include <crypto/schnorr.hpp>
#include <crypto/secure_random.hpp>
#include <crypto/sha256.hpp>

#include <stdexcept>
#include <string>

namespace {

template<std::size_t N> auto hex_array(std::string_view text) -> std::array<std::uint8_t, N>
{
  auto decoded = tidepool::crypto::from_hex_array<N>(text);
  REQUIRE(decoded.has_value());
  return *decoded;
}

}// namespace

TEST_CASE("hex encoding", "[crypto][hex]")
{
  const std::vector<std::uint8_t> bytes{ 0x00, 0x0f, 0xab, 0xff };

  SECTION("to_hex is lowercase") { REQUIRE(tidepool::crypto::to_hex(bytes) == "000fabff"); }

  SECTION("from_hex accepts either case")
  {
    REQUIRE(tidepool::crypto::from_hex("000FabfF") == bytes);
  }

  SECTION("from_hex rejects odd length and bad characters")
  {
    REQUIRE_FALSE(tidepool::crypto::from_hex("abc").has_value());
    REQUIRE_FALSE(tidepool::crypto::from_hex("zz").has_value());
  }

  SECTION("from_hex_array requires the exact length")
  {
    REQUIRE_FALSE(tidepool::crypto::from_hex_array<4>("000fab").has_value());
    REQUIRE(tidepool::crypto::from_hex_array<4>("000fabff").has_value());
  }

  SECTION("is_lower_hex checks length and case")
  {
    REQUIRE(tidepool::crypto::is_lower_hex("00ff", 4));
    REQUIRE_FALSE(tidepool::crypto::is_lower_hex("00FF", 4));
    REQUIRE_FALSE(tidepool::crypto::is_lower_hex("00ff", 6));
  }
}

TEST_CASE("sha256 known answers", "[crypto][sha256]")
{
  SECTION("abc")
  {
    REQUIRE(tidepool::crypto::to_hex(tidepool::crypto::sha256(std::string_view{ "abc" }))
            == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  }

  SECTION("empty input")
  {
    REQUIRE(tidepool::crypto::to_hex(tidepool::crypto::sha256(std::string_view{}))
            == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  }
}

SCENARIO("BIP-340 reference vectors", "[crypto][schnorr]")
{
  GIVEN("test vector 0")
  {
    const auto secret =
      hex_array<32>("0000000000000000000000000000000000000000000000000000000000000003");
    const tidepool::crypto::aux_random aux{};
    const tidepool::crypto::digest message{};

    WHEN("deriving the public key and signing")
    {
      const auto public_key = tidepool::crypto::derive_public_key(secret);
      const auto sig = tidepool::crypto::sign(secret, message, aux);

      THEN("the outputs match the published values")
      {
        REQUIRE(tidepool::crypto::to_hex(public_key)
                == "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9");
        REQUIRE(tidepool::crypto::to_hex(sig)
                == "e907831f80848d1069a5371b402410364bdf1c5f8307b0084c55f1ce2dca8215"
                   "25f66a4a85ea8b71e482a74f382d2ce5ebeee8fdb2172f477df4900d310536c0");
        REQUIRE(tidepool::crypto::verify(public_key, message, sig));
      }
    }
  }

  GIVEN("test vector 1")
  {
    const auto secret =
      hex_array<32>("B7E151628AED2A6ABF7158809CF4F3C762E7160F38B4DA56A784D9045190CFEF");
    const auto aux =
      hex_array<32>("0000000000000000000000000000000000000000000000000000000000000001");
    const auto message =
      hex_array<32>("243F6A8885A308D313198A2E03707344A4093822299F31D0082EFA98EC4E6C89");

    WHEN("signing")
    {
      const auto public_key = tidepool::crypto::derive_public_key(secret);
      const auto sig = tidepool::crypto::sign(secret, message, aux);

      THEN("the outputs match the published values")
      {
        REQUIRE(tidepool::crypto::to_hex(public_key)
                == "dff1d77f2a671c5f36183726db2341be58feae1da2deced843240f7b502ba659");
        REQUIRE(tidepool::crypto::to_hex(sig)
                == "6896bd60eeae296db48a229ff71dfe071bde413e6d43f917dc8dcf8c78de3341"
                   "8906d11ac976abccb20b091292bff4ea897efcb639ea871cfa95f6de339e4b0a");
      }

      AND_WHEN("the message or signature is altered")
      {
        auto other_message = message;
        other_message[0] ^= 0x01U;
        auto other_sig = sig;
        other_sig[63] ^= 0x01U;

        THEN("verification fails")
        {
          REQUIRE_FALSE(tidepool::crypto::verify(public_key, other_message, sig));
          REQUIRE_FALSE(tidepool::crypto::verify(public_key, message, other_sig));
        }
      }
    }
  }
}

TEST_CASE("schnorr rejects malformed input", "[crypto][schnorr]")
{
  SECTION("zero and order-sized secret keys are invalid")
  {
    const tidepool::crypto::secret_key zero{};
    const auto order =
      hex_array<32>("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

    REQUIRE_FALSE(tidepool::crypto::is_valid_secret_key(zero));
    REQUIRE_FALSE(tidepool::crypto::is_valid_secret_key(order));
    REQUIRE_THROWS_AS(tidepool::crypto::derive_public_key(zero), std::invalid_argument);
    REQUIRE_THROWS_AS(tidepool::crypto::sign(order, tidepool::crypto::digest{}), std::invalid_argument);
  }

  SECTION("an x-coordinate not on the curve is not a public key")
  {
    // From BIP-340 test vector 5: public key not on the curve.
    const auto not_on_curve =
      hex_array<32>("EEFDEA4CDB677750A420FEE807EACF21EB9898AE79B9768766E4FAA04A2D4A34");
    const tidepool::crypto::digest message{};
    const tidepool::crypto::signature sig{};

    REQUIRE_FALSE(tidepool::crypto::is_valid_public_key(not_on_curve));
    REQUIRE_FALSE(tidepool::crypto::verify(not_on_curve, message, sig));
  }

  SECTION("an all-zero signature never verifies")
  {
    const auto public_key =
      hex_array<32>("f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9");
    const tidepool::crypto::digest message{};
    const tidepool::crypto::signature sig{};

    REQUIRE_FALSE(tidepool::crypto::verify(public_key, message, sig));
  }
}

TEST_CASE("random keys sign and verify", "[crypto][schnorr]")
{
  tidepool::crypto::secret_key secret{};
  do { tidepool::crypto::fill_random(secret); } while (not tidepool::crypto::is_valid_secret_key(secret));

  const auto public_key = tidepool::crypto::derive_public_key(secret);
  const auto message = tidepool::crypto::sha256(std::string_view{ "tidepool" });
  const auto sig = tidepool::crypto::sign(secret, message);

  REQUIRE(tidepool::crypto::verify(public_key, message, sig));
  REQUIRE(tidepool::crypto::sign(secret, message) == sig);

  tidepool::crypto::secure_wipe(secret);
  REQUIRE(secret == tidepool::crypto::secret_key{});
}
