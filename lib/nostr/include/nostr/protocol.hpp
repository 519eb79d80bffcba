#pragma once

#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tidepool::nostr::protocol {

/// Longest subscription id relays are required to accept
inline constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Checks a subscription id is 1..64 characters.
 * @throws std::invalid_argument otherwise
 */
auto validate_subscription_id(std::string_view subscription_id) -> void;

// Client to relay

/// ["EVENT", <event>]
struct event_message
{
  nostr::event event;

  auto operator==(const event_message &) const -> bool = default;
};

/// ["REQ", <subscription id>, <filter>...]
struct req
{
  std::string subscription_id;
  std::vector<filter> filters;

  auto operator==(const req &) const -> bool = default;
};

/// ["CLOSE", <subscription id>]
struct close
{
  std::string subscription_id;

  auto operator==(const close &) const -> bool = default;
};

using client_message = std::variant<event_message, req, close>;

// Relay to client

/// ["EVENT", <subscription id>, <event>]
struct event_delivery
{
  std::string subscription_id;
  nostr::event event;

  auto operator==(const event_delivery &) const -> bool = default;
};

/// ["OK", <event id>, <accepted>, <message>]
struct ok
{
  std::string event_id;
  bool accepted{};
  std::string message;

  auto operator==(const ok &) const -> bool = default;
};

/// ["EOSE", <subscription id>]
struct eose
{
  std::string subscription_id;

  auto operator==(const eose &) const -> bool = default;
};

/// ["NOTICE", <message>]
struct notice
{
  std::string message;

  auto operator==(const notice &) const -> bool = default;
};

/// ["AUTH", <challenge>]
struct auth
{
  std::string challenge;

  auto operator==(const auth &) const -> bool = default;
};

/// ["CLOSED", <subscription id>, <message>]: the relay ended a subscription
struct closed
{
  std::string subscription_id;
  std::string message;

  auto operator==(const closed &) const -> bool = default;
};

using relay_message = std::variant<event_delivery, ok, eose, notice, auth, closed>;

/**
 * @brief Encodes a client message as one text frame.
 */
[[nodiscard]] auto serialize(const client_message &message) -> std::string;

/**
 * @brief Encodes a relay message as one text frame.
 */
[[nodiscard]] auto serialize(const relay_message &message) -> std::string;

/**
 * @brief Decodes a frame received from a relay.
 *
 * Embedded events are shape-checked but not validated.
 * @throws core::protocol_error for anything that is not a well-formed relay message
 */
[[nodiscard]] auto parse_relay_message(std::string_view frame) -> relay_message;

/**
 * @brief Decodes a frame sent by a client.
 * @throws core::protocol_error for anything that is not a well-formed client message
 */
[[nodiscard]] auto parse_client_message(std::string_view frame) -> client_message;

/// Wire tag of a message, e.g. "REQ" or "EOSE"
[[nodiscard]] auto message_type(const client_message &message) -> std::string_view;
[[nodiscard]] auto message_type(const relay_message &message) -> std::string_view;

}// namespace tidepool::nostr::protocol
