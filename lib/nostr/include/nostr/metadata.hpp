#pragma once

#include <optional>
#include <string>

namespace tidepool::nostr {

/**
 * @brief Profile record carried as the JSON content of a set_metadata event.
 */
struct metadata
{
  std::optional<std::string> name;
  std::optional<std::string> display_name;
  std::optional<std::string> about;
  std::optional<std::string> website;
  std::optional<std::string> picture;
  std::optional<std::string> nip05;
  std::optional<std::string> lud06;///< LNURL pay request
  std::optional<std::string> lud16;///< Lightning address

  /// Compact JSON object; absent fields are omitted
  [[nodiscard]] auto serialize() const -> std::string;

  /**
   * @brief Parses profile JSON. Unknown keys are ignored.
   * @return Parsed record, or std::nullopt if the text is not an object or a known field is not a string
   */
  [[nodiscard]] static auto deserialize(const std::string &json) -> std::optional<metadata>;

  auto operator==(const metadata &) const -> bool = default;
};

}// namespace tidepool::nostr
