#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>

namespace tidepool::nostr {

/**
 * @brief Bounded set of recently seen keys; the oldest key is forgotten once capacity is reached.
 */
class seen_set
{
public:
  explicit seen_set(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  /**
   * @brief Records a key.
   * @return true if the key was not present
   */
  auto insert(const std::string &key) -> bool
  {
    if (keys_.contains(key)) { return false; }
    if (order_.size() >= capacity_) {
      keys_.erase(order_.front());
      order_.pop_front();
    }
    keys_.insert(key);
    order_.push_back(key);
    return true;
  }

  /// Forgets a key so the next insert of it succeeds
  auto erase(const std::string &key) -> void
  {
    if (keys_.erase(key) > 0) { std::erase(order_, key); }
  }

  [[nodiscard]] auto contains(const std::string &key) const -> bool { return keys_.contains(key); }

  [[nodiscard]] auto size() const -> std::size_t { return order_.size(); }

  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

private:
  std::size_t capacity_;
  std::unordered_set<std::string> keys_;
  std::deque<std::string> order_;
};

}// namespace tidepool::nostr
