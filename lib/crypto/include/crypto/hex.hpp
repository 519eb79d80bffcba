#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tidepool::crypto {

/**
 * @brief Encodes bytes as lowercase hexadecimal.
 */
[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/**
 * @brief Decodes hexadecimal text (either case).
 *
 * @return Decoded bytes, or std::nullopt for odd length or non-hex characters
 */
[[nodiscard]] auto from_hex(std::string_view text) -> std::optional<std::vector<std::uint8_t>>;

/**
 * @brief Decodes hexadecimal text into a fixed-size array.
 *
 * @return Decoded array, or std::nullopt if the text does not decode to exactly N bytes
 */
template<std::size_t N> [[nodiscard]] auto from_hex_array(std::string_view text) -> std::optional<std::array<std::uint8_t, N>>
{
  if (text.size() != N * 2) { return std::nullopt; }
  auto bytes = from_hex(text);
  if (not bytes) { return std::nullopt; }
  std::array<std::uint8_t, N> out{};
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return out;
}

/**
 * @brief True if the text is exactly `length` lowercase hexadecimal characters.
 */
[[nodiscard]] auto is_lower_hex(std::string_view text, std::size_t length) noexcept -> bool;

}// namespace tidepool::crypto
