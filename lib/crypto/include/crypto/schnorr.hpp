#pragma once

#include <array>
#include <crypto/sha256.hpp>
#include <cstdint>

namespace tidepool::crypto {

/// 32-byte secp256k1 secret scalar
using secret_key = std::array<std::uint8_t, 32>;
/// 32-byte BIP-340 x-only public key
using xonly_public_key = std::array<std::uint8_t, 32>;
/// 64-byte BIP-340 signature (R.x || s)
using signature = std::array<std::uint8_t, 64>;
/// 32-byte auxiliary randomness mixed into the signing nonce
using aux_random = std::array<std::uint8_t, 32>;

/**
 * @brief True if the scalar is in [1, n-1] for the secp256k1 order n.
 */
[[nodiscard]] auto is_valid_secret_key(const secret_key &key) -> bool;

/**
 * @brief True if the x-coordinate lifts to a point on secp256k1.
 */
[[nodiscard]] auto is_valid_public_key(const xonly_public_key &key) noexcept -> bool;

/**
 * @brief Derives the x-only public key of a secret scalar.
 * @throws std::invalid_argument if the secret key is out of range
 */
[[nodiscard]] auto derive_public_key(const secret_key &key) -> xonly_public_key;

/**
 * @brief Produces a BIP-340 Schnorr signature over a 32-byte message.
 *
 * @param key Secret scalar
 * @param message 32-byte message, normally an event id
 * @param aux Auxiliary randomness; all zero gives deterministic signatures
 * @throws std::invalid_argument if the secret key is out of range
 * @throws std::runtime_error on libsecp256k1 failure
 */
[[nodiscard]] auto sign(const secret_key &key, const digest &message, const aux_random &aux) -> signature;

/**
 * @brief Deterministic signing with all-zero auxiliary randomness.
 */
[[nodiscard]] auto sign(const secret_key &key, const digest &message) -> signature;

/**
 * @brief Verifies a BIP-340 Schnorr signature.
 *
 * @return false for invalid signatures and for malformed keys or out-of-range signature values
 */
[[nodiscard]] auto verify(const xonly_public_key &key, const digest &message, const signature &sig) noexcept -> bool;

}// namespace tidepool::crypto
