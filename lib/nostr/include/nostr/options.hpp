#pragma once

#include <cstddef>
#include <nostr/backoff.hpp>

namespace tidepool::nostr {

/**
 * @brief Settings for one relay session.
 */
struct relay_options
{
  backoff_policy backoff;
  std::size_t max_pending_frames{ 512 };///< Outbound frames buffered per relay; the oldest is dropped when full
  std::size_t command_queue_capacity{ 4096 };
};

/**
 * @brief Settings for a relay pool and the sessions it creates.
 */
struct pool_options
{
  relay_options relay;
  std::size_t seen_capacity{ 65536 };///< Remembered (subscription, event id) pairs for de-duplication
  std::size_t subscription_queue_capacity{ 4096 };
  std::size_t notification_queue_capacity{ 4096 };
  std::size_t wire_queue_capacity{ 4096 };
  std::size_t coordination_queue_capacity{ 16384 };
  bool observe_wire{ false };///< Publish every frame to the wire observation stream
};

}// namespace tidepool::nostr
