#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace tidepool::core {

/**
 * @brief Produces subscription ids that never repeat within the generator's lifetime.
 *
 * Ids are a random UUID-derived prefix joined with a monotonically increasing counter,
 * e.g. "3f0c9a1e52b84d07:17". The result always fits the 64 character wire limit.
 */
class id_generator
{
public:
  id_generator();

  /**
   * @brief Returns the next id. Safe to call from any thread.
   */
  [[nodiscard]] auto next() -> std::string;

  [[nodiscard]] auto prefix() const -> const std::string & { return prefix_; }

  /**
   * @brief Generates a new random UUID string in canonical format.
   */
  [[nodiscard]] static auto random_uuid() -> std::string;

private:
  std::string prefix_;
  std::atomic<std::uint64_t> counter_{ 0 };
};

}// namespace tidepool::core
