#pragma once

#include <cstdint>
#include <nostr/event.hpp>
#include <nostr/metadata.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tidepool::nostr {

/**
 * @brief Entry of a contact list event.
 */
struct contact
{
  std::string pubkey;///< Hex public key of the followed identity
  std::string relay_url;///< Relay where the contact publishes, may be empty
  std::string alias;///< Local petname, may be empty
};

/**
 * @brief Assembles unsigned events for the common kinds and signs them.
 *
 * @code
 * auto note = event_builder::text_note("hello").to_event(identity);
 * @endcode
 */
class event_builder
{
public:
  event_builder(enum kind kind, std::string content, std::vector<tag> tags = {});

  [[nodiscard]] static auto text_note(std::string content, std::vector<tag> tags = {}) -> event_builder;

  [[nodiscard]] static auto set_metadata(const metadata &profile) -> event_builder;

  [[nodiscard]] static auto add_recommended_relay(std::string relay_url) -> event_builder;

  [[nodiscard]] static auto set_contact_list(const std::vector<contact> &contacts) -> event_builder;

  /**
   * @brief Deletion request referencing each id with an "e" tag; the reason becomes the content.
   */
  [[nodiscard]] static auto delete_events(const std::vector<std::string> &event_ids,
    std::optional<std::string> reason = std::nullopt) -> event_builder;

  /**
   * @brief Reaction with "e" and "p" tags pointing at the target; content "+" or "-".
   */
  [[nodiscard]] static auto reaction(const event &target, bool positive) -> event_builder;

  /// Fixes the timestamp instead of using the current time
  auto created_at(std::uint64_t timestamp) -> event_builder &;

  [[nodiscard]] auto to_unsigned_event() const -> unsigned_event;

  /// @throws core::key_error if the identity is verify-only
  [[nodiscard]] auto to_event(const keys &signer) const -> event;

private:
  enum kind kind_;
  std::string content_;
  std::vector<tag> tags_;
  std::optional<std::uint64_t> created_at_;
};

}// namespace tidepool::nostr
