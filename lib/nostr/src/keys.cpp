#include <nostr/keys.hpp>

#include <core/errors.hpp>
#include <crypto/bech32.hpp>
#include <crypto/hex.hpp>
#include <crypto/secure_random.hpp>

#include <algorithm>
#include <array>
#include <string>

namespace tidepool::nostr {

namespace {
  constexpr std::size_t key_size = 32;

  /// Accepts hex or a bech32 string with the given prefix
  auto decode_key_text(std::string_view text, std::string_view prefix) -> std::optional<std::array<std::uint8_t, key_size>>
  {
    if (text.starts_with(prefix) and text.size() > prefix.size() and text[prefix.size()] == '1') {
      auto decoded = crypto::bech32::decode(text);
      if (not decoded or decoded->hrp != prefix or decoded->data.size() != key_size) { return std::nullopt; }
      std::array<std::uint8_t, key_size> out{};
      std::copy(decoded->data.begin(), decoded->data.end(), out.begin());
      return out;
    }
    return crypto::from_hex_array<key_size>(text);
  }
}// namespace

keys::keys(std::optional<crypto::secret_key> secret, crypto::xonly_public_key public_key)
  : secret_key_(std::move(secret)), public_key_(public_key)
{}

keys::~keys()
{
  if (secret_key_) { crypto::secure_wipe(*secret_key_); }
}

auto keys::generate() -> keys
{
  crypto::secret_key secret{};
  do { crypto::fill_random(secret); } while (not crypto::is_valid_secret_key(secret));
  auto result = keys(secret, crypto::derive_public_key(secret));
  crypto::secure_wipe(secret);
  return result;
}

auto keys::from_secret(std::span<const std::uint8_t> secret) -> keys
{
  if (secret.size() != key_size) {
    throw core::key_error(core::key_errc::invalid_secret_key, "expected 32 bytes, got " + std::to_string(secret.size()));
  }
  crypto::secret_key scalar{};
  std::copy(secret.begin(), secret.end(), scalar.begin());
  if (not crypto::is_valid_secret_key(scalar)) {
    crypto::secure_wipe(scalar);
    throw core::key_error(core::key_errc::invalid_secret_key, "scalar is zero or not below the curve order");
  }
  auto result = keys(scalar, crypto::derive_public_key(scalar));
  crypto::secure_wipe(scalar);
  return result;
}

auto keys::from_secret_key_string(std::string_view text) -> keys
{
  auto bytes = decode_key_text(text, secret_key_prefix);
  if (not bytes) { throw core::key_error(core::key_errc::invalid_encoding, "expected 64 hex characters or nsec1..."); }
  auto result = from_secret(*bytes);
  crypto::secure_wipe(*bytes);
  return result;
}

auto keys::from_public_key_string(std::string_view text) -> keys
{
  auto bytes = decode_key_text(text, public_key_prefix);
  if (not bytes) { throw core::key_error(core::key_errc::invalid_encoding, "expected 64 hex characters or npub1..."); }
  if (not crypto::is_valid_public_key(*bytes)) {
    throw core::key_error(core::key_errc::invalid_public_key, "x-coordinate is not on secp256k1");
  }
  return { std::nullopt, *bytes };
}

auto keys::public_key_hex() const -> std::string { return crypto::to_hex(public_key_); }

auto keys::secret_key_hex() const -> std::string
{
  if (not secret_key_) { throw core::key_error(core::key_errc::secret_key_missing, "identity is verify-only"); }
  return crypto::to_hex(*secret_key_);
}

auto keys::to_npub() const -> std::string { return crypto::bech32::encode(public_key_prefix, public_key_); }

auto keys::to_nsec() const -> std::string
{
  if (not secret_key_) { throw core::key_error(core::key_errc::secret_key_missing, "identity is verify-only"); }
  return crypto::bech32::encode(secret_key_prefix, *secret_key_);
}

auto keys::sign(const crypto::digest &message) const -> crypto::signature
{
  if (not secret_key_) { throw core::key_error(core::key_errc::secret_key_missing, "identity is verify-only"); }
  return crypto::sign(*secret_key_, message);
}

auto keys::verify(const crypto::xonly_public_key &public_key,
  const crypto::digest &message,
  const crypto::signature &sig) noexcept -> bool
{
  return crypto::verify(public_key, message, sig);
}

auto keys::verify(std::string_view public_key_hex, std::string_view message_hex, std::string_view sig_hex) noexcept
  -> bool
{
  try {
    const auto public_key = crypto::from_hex_array<32>(public_key_hex);
    const auto message = crypto::from_hex_array<32>(message_hex);
    const auto sig = crypto::from_hex_array<64>(sig_hex);
    if (not public_key or not message or not sig) { return false; }
    return crypto::verify(*public_key, *message, *sig);
  } catch (const std::exception &) {
    return false;
  }
}

}// namespace tidepool::nostr
