#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tidepool::crypto::bech32 {

/// Human-readable part and 8-bit payload of a bech32 string
struct decoded
{
  std::string hrp;
  std::vector<std::uint8_t> data;
};

/**
 * @brief Encodes an 8-bit payload as BIP-173 bech32 (lowercase).
 *
 * @param hrp Human-readable prefix such as "npub"
 * @param data Payload bytes
 */
[[nodiscard]] auto encode(std::string_view hrp, std::span<const std::uint8_t> data) -> std::string;

/**
 * @brief Decodes a bech32 string and verifies its checksum.
 *
 * @return Prefix and payload, or std::nullopt for mixed case, bad characters, bad checksum or padding
 */
[[nodiscard]] auto decode(std::string_view text) -> std::optional<decoded>;

}// namespace tidepool::crypto::bech32
