#pragma once

#include <async/async_queue.hpp>
#include <cstdint>
#include <memory>
#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <nostr/protocol.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tidepool::nostr {

/// Lifecycle state of one relay session
enum class relay_status : std::uint8_t {
  disconnected,
  connecting,
  connected,
  terminated,
};

[[nodiscard]] constexpr auto to_string(relay_status status) -> std::string_view
{
  switch (status) {
  case relay_status::disconnected:
    return "disconnected";
  case relay_status::connecting:
    return "connecting";
  case relay_status::connected:
    return "connected";
  case relay_status::terminated:
    return "terminated";
  }
  return "unknown";
}

}// namespace tidepool::nostr

namespace tidepool::nostr::events {

/// Direction of an observed wire message
enum class direction : std::uint8_t {
  inbound,
  outbound,
};

/// One frame exchanged with a relay, as observed by the pool
struct wire_message
{
  std::string relay_url;///< Relay the frame was exchanged with
  enum direction direction {};///< Whether the frame was sent or received
  std::variant<protocol::client_message, protocol::relay_message> message;///< Decoded frame
};

// Subscriber stream

/// Validated, filter-matching, first-seen event for a subscription
struct event_received
{
  std::string subscription_id;///< Subscription the event answers
  std::string relay_url;///< Relay that delivered it first
  nostr::event event;///< The event
};

/// A relay finished replaying stored events for a subscription
struct end_of_stored_events
{
  std::string subscription_id;///< Subscription id
  std::string relay_url;///< Relay that finished
};

/// Every relay present when the subscription opened has finished replaying
struct replay_complete
{
  std::string subscription_id;///< Subscription id
};

/// A relay ended the subscription on its side
struct subscription_closed
{
  std::string subscription_id;///< Subscription id
  std::string relay_url;///< Relay that closed it
  std::string message;///< Relay-supplied reason
};

using subscription_update_t = std::variant<event_received, end_of_stored_events, replay_complete, subscription_closed>;

using subscription_queue_t = async::async_queue<subscription_update_t>;

// Pool notification stream

/// A session changed state
struct relay_status_changed
{
  std::string relay_url;///< Relay URL
  relay_status status{};///< New state
  std::string error;///< Failure that caused a disconnect, empty otherwise
};

/// A relay accepted or rejected a published event
struct publish_acknowledged
{
  std::string relay_url;///< Relay URL
  std::string event_id;///< Event the relay answered for
  bool accepted{};///< Relay verdict
  std::string message;///< Relay-supplied detail
};

/// Free-form relay notice
struct relay_notice
{
  std::string relay_url;///< Relay URL
  std::string message;///< Notice text
};

/// A relay asked the client to authenticate
struct auth_requested
{
  std::string relay_url;///< Relay URL
  std::string challenge;///< Challenge string
};

/// State of one relay in a status report
struct relay_state
{
  std::string relay_url;///< Relay URL
  relay_status status{};///< Current state
};

/// Answer to relay_pool::query_status()
struct status_report
{
  std::vector<relay_state> relays;///< All relays, ordered by URL
  std::size_t subscriptions{};///< Open subscriptions
};

using notification_t =
  std::variant<relay_status_changed, publish_acknowledged, relay_notice, auth_requested, status_report>;

/// Inputs of a relay session
namespace session {

  /// Start connecting if disconnected
  struct connect
  {
  };

  /// Send an event, or queue it until connected
  struct publish
  {
    nostr::event event;///< Validated event
  };

  /// Add a subscription to the mirrored set
  struct open_subscription
  {
    std::string subscription_id;///< Subscription id
    std::vector<filter> filters;///< OR-combined filters
  };

  /// Remove a subscription from the mirrored set
  struct close_subscription
  {
    std::string subscription_id;///< Subscription id
  };

  /// Stop permanently
  struct terminate
  {
  };

  /// Transport finished connecting
  struct transport_connected
  {
    std::uint64_t generation{};///< Connection attempt the callback belongs to
  };

  /// Transport failed to connect
  struct transport_connect_failed
  {
    std::uint64_t generation{};///< Connection attempt the callback belongs to
    std::string error;///< Failure description
  };

  /// Transport received a text frame
  struct frame_received
  {
    std::uint64_t generation{};///< Connection attempt the callback belongs to
    std::string text;///< Frame payload
  };

  /// Transport finished writing the in-flight frame
  struct frame_written
  {
    std::uint64_t generation{};///< Connection attempt the callback belongs to
    std::string error;///< Failure description, empty on success
  };

  /// Transport lost the connection
  struct transport_closed
  {
    std::uint64_t generation{};///< Connection attempt the callback belongs to
    std::string error;///< Failure description
  };

  /// Backoff timer fired
  struct reconnect_due
  {
    std::uint64_t generation{};///< Connection attempt the timer was armed for
  };

  using in_t = std::variant<connect,
    publish,
    open_subscription,
    close_subscription,
    terminate,
    transport_connected,
    transport_connect_failed,
    frame_received,
    frame_written,
    transport_closed,
    reconnect_due>;

}// namespace session

/// Inputs of the pool's coordination loop
namespace pool {

  /// Register a relay
  struct add_relay
  {
    std::string relay_url;///< Validated relay URL
    bool connect{};///< Connect immediately
  };

  /// Terminate and forget a relay
  struct remove_relay
  {
    std::string relay_url;///< Relay URL
  };

  /// Connect one relay, or all when the URL is empty
  struct connect
  {
    std::string relay_url;///< Relay URL or empty
  };

  /// Broadcast an event
  struct publish
  {
    nostr::event event;///< Validated event
  };

  /// Open a subscription on every relay
  struct subscribe
  {
    std::string subscription_id;///< Allocated id
    std::vector<filter> filters;///< Validated filters
    std::shared_ptr<subscription_queue_t> updates;///< Subscriber stream
  };

  /// Close a subscription on every relay
  struct unsubscribe
  {
    std::string subscription_id;///< Subscription id
  };

  /// Emit a status_report notification
  struct query_status
  {
  };

  /// Terminate everything and stop
  struct shutdown
  {
  };

  /// A session changed state
  struct session_status
  {
    std::string relay_url;///< Relay URL
    std::uint64_t session_serial{};///< Which session for this URL reported it
    relay_status status{};///< New state
    std::string error;///< Failure description
  };

  /// A session decoded a relay message
  struct session_message
  {
    std::string relay_url;///< Relay URL
    std::uint64_t session_serial{};///< Which session for this URL reported it
    protocol::relay_message message;///< Decoded message
  };

  using in_t = std::variant<add_relay,
    remove_relay,
    connect,
    publish,
    subscribe,
    unsubscribe,
    query_status,
    shutdown,
    session_status,
    session_message>;

}// namespace pool

}// namespace tidepool::nostr::events
