#pragma once

#include <cstdint>
#include <string>

namespace tidepool::platform {

/**
 * @brief Returns the current wall-clock time as whole seconds since the UNIX epoch.
 */
[[nodiscard]] auto unix_timestamp_now() -> std::uint64_t;

/**
 * @brief Formats a UNIX timestamp as local "YYYY-MM-DD HH:MM:SS".
 *
 * @param timestamp Seconds since the UNIX epoch
 * @return Formatted local time
 */
[[nodiscard]] auto format_unix_timestamp(std::uint64_t timestamp) -> std::string;

}// namespace tidepool::platform
