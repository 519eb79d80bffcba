#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace tidepool::nostr {

/**
 * @brief Reconnect delay policy: exponential growth, capped, with proportional jitter.
 */
struct backoff_policy
{
  std::chrono::milliseconds initial_delay{ std::chrono::seconds(1) };
  std::chrono::milliseconds max_delay{ std::chrono::seconds(60) };
  double multiplier{ 2.0 };
  double jitter{ 0.2 };///< Fraction of the delay added or removed at random, 0 disables
  std::chrono::milliseconds stability_threshold{ std::chrono::seconds(30) };///< Connected this long resets the growth
};

/**
 * @brief Per-relay reconnect bookkeeping. Owned and mutated only by its session.
 */
class backoff
{
public:
  using clock = std::chrono::steady_clock;

  explicit backoff(backoff_policy policy = {});

  /**
   * @brief Delay before the next connection attempt; advances the attempt counter.
   */
  [[nodiscard]] auto next_delay() -> std::chrono::milliseconds;

  /// Records the moment a connection was established
  auto on_connected(clock::time_point now = clock::now()) -> void;

  /// Records a disconnect; resets the growth if the connection stayed up past the stability threshold
  auto on_disconnected(clock::time_point now = clock::now()) -> void;

  [[nodiscard]] auto attempts() const -> std::uint32_t { return attempts_; }

  [[nodiscard]] auto policy() const -> const backoff_policy & { return policy_; }

private:
  backoff_policy policy_;
  std::uint32_t attempts_{ 0 };
  std::optional<clock::time_point> connected_at_;
  std::mt19937_64 rng_;
};

}// namespace tidepool::nostr
