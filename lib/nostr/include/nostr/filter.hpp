#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <nostr/event.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tidepool::nostr {

/**
 * @brief Conjunction of optional constraints selecting events.
 *
 * Absent constraints match everything. `limit` is only a hint for the relay's replay and is not
 * applied by matches(). Tag constraints are keyed by the single-letter tag name without the '#'.
 */
struct filter
{
  std::optional<std::vector<std::string>> ids;
  std::optional<std::vector<std::string>> authors;
  std::optional<std::vector<enum kind>> kinds;
  std::map<std::string, std::vector<std::string>> tags;
  std::optional<std::uint64_t> since;///< Inclusive lower bound on created_at
  std::optional<std::uint64_t> until;///< Inclusive upper bound on created_at
  std::optional<std::size_t> limit;

  [[nodiscard]] auto matches(const event &evt) const -> bool;

  /**
   * @brief Rejects contradictory or unusable constraints.
   * @throws std::invalid_argument for since > until, an empty tag name, or an empty tag value set
   */
  auto validate() const -> void;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Builds a filter from its wire form, ignoring unknown keys.
   * @throws std::invalid_argument for wrongly typed values
   */
  [[nodiscard]] static auto from_json(const nlohmann::json &json) -> filter;

  // Fluent construction
  auto id(std::string value) -> filter &;
  auto author(std::string value) -> filter &;
  auto kind(enum kind value) -> filter &;
  auto tag(const std::string &name, std::string value) -> filter &;
  auto since_time(std::uint64_t timestamp) -> filter &;
  auto until_time(std::uint64_t timestamp) -> filter &;
  auto limit_to(std::size_t count) -> filter &;

  auto operator==(const filter &) const -> bool = default;
};

/**
 * @brief True if any filter matches. Filters of one subscription combine by OR.
 */
[[nodiscard]] auto matches_any(const std::vector<filter> &filters, const event &evt) -> bool;

}// namespace tidepool::nostr
