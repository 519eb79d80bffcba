#include <nostr/backoff.hpp>

#include <algorithm>
#include <cmath>

namespace tidepool::nostr {

backoff::backoff(backoff_policy policy) : policy_(policy), rng_(std::random_device{}()) {}

auto backoff::next_delay() -> std::chrono::milliseconds
{
  const auto initial = static_cast<double>(policy_.initial_delay.count());
  const auto ceiling = static_cast<double>(policy_.max_delay.count());

  auto delay = std::min(initial * std::pow(policy_.multiplier, static_cast<double>(attempts_)), ceiling);
  if (policy_.jitter > 0.0) {
    std::uniform_real_distribution<double> spread(1.0 - policy_.jitter, 1.0 + policy_.jitter);
    delay = std::clamp(delay * spread(rng_), 0.0, ceiling);
  }

  ++attempts_;
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

auto backoff::on_connected(clock::time_point now) -> void { connected_at_ = now; }

auto backoff::on_disconnected(clock::time_point now) -> void
{
  if (connected_at_ and now - *connected_at_ >= policy_.stability_threshold) { attempts_ = 0; }
  connected_at_.reset();
}

}// namespace tidepool::nostr
