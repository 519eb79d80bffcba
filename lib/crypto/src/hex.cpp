#include <crypto/hex.hpp>

namespace tidepool::crypto {

namespace {
  constexpr std::string_view hex_digits = "0123456789abcdef";

  constexpr auto nibble(char chr) noexcept -> int
  {
    if (chr >= '0' and chr <= '9') { return chr - '0'; }
    if (chr >= 'a' and chr <= 'f') { return chr - 'a' + 10; }
    if (chr >= 'A' and chr <= 'F') { return chr - 'A' + 10; }
    return -1;
  }
}// namespace

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(hex_digits[byte >> 4U]);
    out.push_back(hex_digits[byte & 0x0FU]);
  }
  return out;
}

auto from_hex(std::string_view text) -> std::optional<std::vector<std::uint8_t>>
{
  if (text.size() % 2 != 0) { return std::nullopt; }

  std::vector<std::uint8_t> out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const auto high = nibble(text[i]);
    const auto low = nibble(text[i + 1]);
    if (high < 0 or low < 0) { return std::nullopt; }
    out.push_back(static_cast<std::uint8_t>((high << 4) | low));
  }
  return out;
}

auto is_lower_hex(std::string_view text, std::size_t length) noexcept -> bool
{
  if (text.size() != length) { return false; }
  return text.find_first_not_of(hex_digits) == std::string_view::npos;
}

}// namespace tidepool::crypto
