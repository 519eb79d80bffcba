#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace tidepool::crypto {

/// 32-byte SHA-256 digest
using digest = std::array<std::uint8_t, 32>;

/**
 * @brief Hashes bytes with SHA-256.
 * @throws std::runtime_error if OpenSSL fails
 */
[[nodiscard]] auto sha256(std::span<const std::uint8_t> data) -> digest;

/**
 * @brief Hashes the UTF-8 bytes of a string with SHA-256.
 */
[[nodiscard]] auto sha256(std::string_view text) -> digest;

/**
 * @brief BIP-340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data).
 */
[[nodiscard]] auto tagged_hash(std::string_view tag, std::span<const std::uint8_t> data) -> digest;

}// namespace tidepool::crypto
