#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tidepool::core {

/// Reasons a key could not be constructed or used
enum class key_errc : std::uint8_t {
  invalid_secret_key,
  invalid_public_key,
  invalid_encoding,
  secret_key_missing,
};

/// Reasons an event failed validation
enum class validation_reason : std::uint8_t {
  id_mismatch,
  invalid_signature,
  malformed_field,
};

/// Reasons a pool operation was rejected
enum class pool_errc : std::uint8_t {
  invalid_relay_url,
  pool_stopped,
};

[[nodiscard]] constexpr auto to_string(key_errc code) -> std::string_view
{
  switch (code) {
  case key_errc::invalid_secret_key:
    return "invalid secret key";
  case key_errc::invalid_public_key:
    return "invalid public key";
  case key_errc::invalid_encoding:
    return "invalid key encoding";
  case key_errc::secret_key_missing:
    return "secret key missing";
  }
  return "unknown key error";
}

[[nodiscard]] constexpr auto to_string(validation_reason reason) -> std::string_view
{
  switch (reason) {
  case validation_reason::id_mismatch:
    return "id mismatch";
  case validation_reason::invalid_signature:
    return "invalid signature";
  case validation_reason::malformed_field:
    return "malformed field";
  }
  return "unknown validation failure";
}

[[nodiscard]] constexpr auto to_string(pool_errc code) -> std::string_view
{
  switch (code) {
  case pool_errc::invalid_relay_url:
    return "invalid relay url";
  case pool_errc::pool_stopped:
    return "pool stopped";
  }
  return "unknown pool error";
}

/**
 * @brief Raised when a secret or public key is out of range, mis-encoded or absent.
 */
class key_error : public std::runtime_error
{
public:
  key_error(key_errc code, const std::string &detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code)
  {}

  [[nodiscard]] auto code() const noexcept -> key_errc { return code_; }

private:
  key_errc code_;
};

/**
 * @brief Raised when an event's id, signature or field shapes do not check out.
 */
class event_validation_error : public std::runtime_error
{
public:
  event_validation_error(validation_reason reason, const std::string &detail)
    : std::runtime_error(std::string(to_string(reason)) + ": " + detail), reason_(reason)
  {}

  [[nodiscard]] auto reason() const noexcept -> validation_reason { return reason_; }

private:
  validation_reason reason_;
};

/**
 * @brief Raised when a wire frame is not a well-formed protocol message.
 */
class protocol_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Raised for unusable relay addresses and connection failures.
 */
class transport_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Raised synchronously by pool API calls.
 */
class pool_error : public std::runtime_error
{
public:
  pool_error(pool_errc code, const std::string &detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code)
  {}

  [[nodiscard]] auto code() const noexcept -> pool_errc { return code_; }

private:
  pool_errc code_;
};

}// namespace tidepool::core
