#include <crypto/bech32.hpp>

#include <array>
#include <cctype>

namespace tidepool::crypto::bech32 {

namespace {
  constexpr std::string_view charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
  constexpr std::size_t checksum_length = 6;
  constexpr std::size_t max_length = 1023;

  auto polymod(const std::vector<std::uint8_t> &values) -> std::uint32_t
  {
    constexpr std::array<std::uint32_t, 5> generator{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
    std::uint32_t chk = 1;
    for (const auto value : values) {
      const auto top = chk >> 25U;
      chk = ((chk & 0x1ffffffU) << 5U) ^ value;
      for (std::size_t i = 0; i < generator.size(); ++i) {
        if (((top >> i) & 1U) != 0) { chk ^= generator.at(i); }
      }
    }
    return chk;
  }

  auto expand_hrp(std::string_view hrp) -> std::vector<std::uint8_t>
  {
    std::vector<std::uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (const char chr : hrp) { out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(chr) >> 5U)); }
    out.push_back(0);
    for (const char chr : hrp) { out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(chr) & 31U)); }
    return out;
  }

  auto convert_bits(std::span<const std::uint8_t> input, unsigned from, unsigned to, bool pad)
    -> std::optional<std::vector<std::uint8_t>>
  {
    std::vector<std::uint8_t> out;
    std::uint32_t acc = 0;
    unsigned bits = 0;
    const std::uint32_t max_value = (1U << to) - 1;
    for (const auto value : input) {
      if ((value >> from) != 0) { return std::nullopt; }
      acc = (acc << from) | value;
      bits += from;
      while (bits >= to) {
        bits -= to;
        out.push_back(static_cast<std::uint8_t>((acc >> bits) & max_value));
      }
    }
    if (pad) {
      if (bits > 0) { out.push_back(static_cast<std::uint8_t>((acc << (to - bits)) & max_value)); }
    } else if (bits >= from or ((acc << (to - bits)) & max_value) != 0) {
      return std::nullopt;
    }
    return out;
  }
}// namespace

auto encode(std::string_view hrp, std::span<const std::uint8_t> data) -> std::string
{
  auto values = *convert_bits(data, 8, 5, true);

  auto checksum_input = expand_hrp(hrp);
  checksum_input.insert(checksum_input.end(), values.begin(), values.end());
  checksum_input.resize(checksum_input.size() + checksum_length, 0);
  const auto mod = polymod(checksum_input) ^ 1U;
  for (std::size_t i = 0; i < checksum_length; ++i) {
    values.push_back(static_cast<std::uint8_t>((mod >> (5 * (5 - i))) & 31U));
  }

  std::string out(hrp);
  out.push_back('1');
  for (const auto value : values) { out.push_back(charset[value]); }
  return out;
}

auto decode(std::string_view text) -> std::optional<decoded>
{
  if (text.size() > max_length) { return std::nullopt; }

  bool has_lower = false;
  bool has_upper = false;
  std::string lowered;
  lowered.reserve(text.size());
  for (const char chr : text) {
    const auto uchr = static_cast<unsigned char>(chr);
    if (uchr < 33 or uchr > 126) { return std::nullopt; }
    if (std::islower(uchr) != 0) { has_lower = true; }
    if (std::isupper(uchr) != 0) { has_upper = true; }
    lowered.push_back(static_cast<char>(std::tolower(uchr)));
  }
  if (has_lower and has_upper) { return std::nullopt; }

  const auto separator = lowered.rfind('1');
  if (separator == std::string::npos or separator == 0 or separator + checksum_length + 1 > lowered.size()) {
    return std::nullopt;
  }

  const auto hrp = std::string_view(lowered).substr(0, separator);
  std::vector<std::uint8_t> values;
  for (const char chr : std::string_view(lowered).substr(separator + 1)) {
    const auto pos = charset.find(chr);
    if (pos == std::string_view::npos) { return std::nullopt; }
    values.push_back(static_cast<std::uint8_t>(pos));
  }

  auto checksum_input = expand_hrp(hrp);
  checksum_input.insert(checksum_input.end(), values.begin(), values.end());
  if (polymod(checksum_input) != 1) { return std::nullopt; }

  values.resize(values.size() - checksum_length);
  auto data = convert_bits(values, 5, 8, false);
  if (not data) { return std::nullopt; }

  return decoded{ .hrp = std::string(hrp), .data = std::move(*data) };
}

}// namespace tidepool::crypto::bech32
