#pragma once

#include <crypto/schnorr.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tidepool::nostr {

/// bech32 prefix of an encoded public key
inline constexpr std::string_view public_key_prefix = "npub";
/// bech32 prefix of an encoded secret key
inline constexpr std::string_view secret_key_prefix = "nsec";

/**
 * @brief A signing identity: a secp256k1 secret scalar and its x-only public key.
 *
 * Identities built from a public key alone can verify but not sign. The secret scalar is wiped on destruction.
 * Instances are immutable and safe to share between threads.
 */
class keys
{
public:
  keys(const keys &) = default;
  keys(keys &&) noexcept = default;
  auto operator=(const keys &) -> keys & = default;
  auto operator=(keys &&) noexcept -> keys & = default;
  ~keys();

  /**
   * @brief Generates a fresh identity from the OpenSSL CSPRNG.
   */
  [[nodiscard]] static auto generate() -> keys;

  /**
   * @brief Builds an identity from 32 raw secret bytes.
   * @throws core::key_error (invalid_secret_key) for wrong length, zero, or a value not below the curve order
   */
  [[nodiscard]] static auto from_secret(std::span<const std::uint8_t> secret) -> keys;

  /**
   * @brief Builds an identity from a 64 character hex secret or an "nsec1..." string.
   * @throws core::key_error
   */
  [[nodiscard]] static auto from_secret_key_string(std::string_view text) -> keys;

  /**
   * @brief Builds a verify-only identity from a 64 character hex key or an "npub1..." string.
   * @throws core::key_error
   */
  [[nodiscard]] static auto from_public_key_string(std::string_view text) -> keys;

  [[nodiscard]] auto public_key() const -> const crypto::xonly_public_key & { return public_key_; }

  /// Lowercase hex form used in event `pubkey` fields
  [[nodiscard]] auto public_key_hex() const -> std::string;

  [[nodiscard]] auto has_secret_key() const -> bool { return secret_key_.has_value(); }

  /// @throws core::key_error (secret_key_missing)
  [[nodiscard]] auto secret_key_hex() const -> std::string;

  [[nodiscard]] auto to_npub() const -> std::string;

  /// @throws core::key_error (secret_key_missing)
  [[nodiscard]] auto to_nsec() const -> std::string;

  /**
   * @brief Signs a 32-byte digest deterministically.
   * @throws core::key_error (secret_key_missing)
   */
  [[nodiscard]] auto sign(const crypto::digest &message) const -> crypto::signature;

  /**
   * @brief Verifies a signature. Never throws; malformed inputs yield false.
   */
  [[nodiscard]] static auto verify(const crypto::xonly_public_key &public_key,
    const crypto::digest &message,
    const crypto::signature &sig) noexcept -> bool;

  /**
   * @brief Verifies hex-encoded key, digest and signature. Never throws.
   */
  [[nodiscard]] static auto verify(std::string_view public_key_hex,
    std::string_view message_hex,
    std::string_view sig_hex) noexcept -> bool;

private:
  keys(std::optional<crypto::secret_key> secret, crypto::xonly_public_key public_key);

  std::optional<crypto::secret_key> secret_key_;
  crypto::xonly_public_key public_key_;
};

}// namespace tidepool::nostr
