#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tidepool::nostr {

class keys;

/**
 * @brief Event kind identifiers. Any 16-bit value is a valid kind; the named ones have builders.
 */
enum class kind : std::uint16_t {
  set_metadata = 0,///< Profile metadata (NIP-01)
  text_note = 1,///< Short text note (NIP-01)
  recommend_relay = 2,///< Relay recommendation (NIP-01)
  contact_list = 3,///< Contact list (NIP-02)
  encrypted_direct_message = 4,///< Encrypted direct message (NIP-04)
  event_deletion = 5,///< Deletion request (NIP-09)
  reaction = 7,///< Reaction (NIP-25)
};

/// One tag: a name followed by positional string values
using tag = std::vector<std::string>;

/**
 * @brief A signed event as it travels on the wire.
 */
struct event
{
  std::string id;///< SHA-256 of the canonical serialization (64 lowercase hex)
  std::string pubkey;///< Author's x-only public key (64 lowercase hex)
  std::uint64_t created_at{};///< UNIX timestamp in seconds
  enum kind kind {};///< Event kind
  std::vector<tag> tags;///< Ordered tags
  std::string content;///< Arbitrary UTF-8 content
  std::string sig;///< BIP-340 signature over the id bytes (128 lowercase hex)

  /**
   * @brief Builds an event from its JSON object form.
   * @throws core::event_validation_error (malformed_field) for missing or mistyped fields
   */
  [[nodiscard]] static auto from_json(const nlohmann::json &json) -> event;

  /**
   * @brief Parses a JSON object string.
   * @return Parsed event, or std::nullopt if it is not well formed
   */
  [[nodiscard]] static auto deserialize(const std::string &json) -> std::optional<event>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /// Compact JSON object text
  [[nodiscard]] auto serialize() const -> std::string;

  /**
   * @brief Recomputes the id from the other fields.
   * @throws core::event_validation_error (malformed_field) if the content or tags are not valid UTF-8
   */
  [[nodiscard]] auto compute_id() const -> std::string;

  auto operator==(const event &) const -> bool = default;
};

/**
 * @brief An event before it is signed. `sign` fills in the author, id and signature.
 */
struct unsigned_event
{
  std::uint64_t created_at{};
  enum kind kind {};
  std::vector<tag> tags;
  std::string content;

  /**
   * @brief Sets the author, computes the id, then signs it.
   * @throws core::key_error if the identity is verify-only
   */
  [[nodiscard]] auto sign(const keys &signer) const -> event;
};

/**
 * @brief Canonical serialization hashed for the id: `[0,pubkey,created_at,kind,tags,content]`, compact,
 * UTF-8 passthrough, with control characters and the characters `"` and `\` escaped.
 *
 * @throws core::event_validation_error (malformed_field) on invalid UTF-8
 */
[[nodiscard]] auto canonical_serialization(std::string_view pubkey,
  std::uint64_t created_at,
  enum kind kind,
  const std::vector<tag> &tags,
  std::string_view content) -> std::string;

/**
 * @brief Lowercase hex SHA-256 of the canonical serialization.
 */
[[nodiscard]] auto compute_event_id(std::string_view pubkey,
  std::uint64_t created_at,
  enum kind kind,
  const std::vector<tag> &tags,
  std::string_view content) -> std::string;

/**
 * @brief Checks field shapes, the id, then the signature.
 * @throws core::event_validation_error naming the first failure
 */
auto validate(const event &evt) -> void;

/**
 * @brief Non-throwing form of validate().
 */
[[nodiscard]] auto is_valid(const event &evt) noexcept -> bool;

}// namespace tidepool::nostr
