#pragma once

#include <cstdint>
#include <span>

namespace tidepool::crypto {

/**
 * @brief Fills the buffer from the OpenSSL CSPRNG.
 * @throws std::runtime_error if RAND_bytes fails
 */
auto fill_random(std::span<std::uint8_t> buffer) -> void;

/**
 * @brief Overwrites the buffer with zeros in a way the optimizer cannot elide.
 */
auto secure_wipe(std::span<std::uint8_t> buffer) noexcept -> void;

}// namespace tidepool::crypto
