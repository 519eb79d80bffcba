#include <crypto/secure_random.hpp>

#include <climits>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>

namespace tidepool::crypto {

auto fill_random(std::span<std::uint8_t> buffer) -> void
{
  if (buffer.size() > static_cast<std::size_t>(INT_MAX)) { throw std::length_error("random request too large"); }
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
  }
}

auto secure_wipe(std::span<std::uint8_t> buffer) noexcept -> void { OPENSSL_cleanse(buffer.data(), buffer.size()); }

}// namespace tidepool::crypto
