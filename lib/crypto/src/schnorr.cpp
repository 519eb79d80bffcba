#include <crypto/schnorr.hpp>

#include <crypto/secure_random.hpp>

#include <array>
#include <memory>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>
#include <span>
#include <stdexcept>

namespace tidepool::crypto {

namespace {

  using context_ptr = std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

  /// Wipes a keypair, which holds the secret scalar, when it leaves scope
  struct scoped_keypair
  {
    secp256k1_keypair value{};

    scoped_keypair() = default;
    scoped_keypair(const scoped_keypair &) = delete;
    auto operator=(const scoped_keypair &) -> scoped_keypair & = delete;
    scoped_keypair(scoped_keypair &&) = delete;
    auto operator=(scoped_keypair &&) -> scoped_keypair & = delete;
    ~scoped_keypair() { secure_wipe(std::span<std::uint8_t>(value.data)); }
  };

  auto make_context() -> context_ptr
  {
    context_ptr ctx(
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY), secp256k1_context_destroy);
    if (not ctx) { throw std::runtime_error("secp256k1_context_create failed"); }

    std::array<std::uint8_t, 32> seed{};
    fill_random(seed);
    const auto randomized = secp256k1_context_randomize(ctx.get(), seed.data());
    secure_wipe(seed);
    if (randomized != 1) { throw std::runtime_error("secp256k1_context_randomize failed"); }
    return ctx;
  }

  // Signing and verification only read the context, so one instance serves every thread.
  auto context() -> const secp256k1_context *
  {
    static const context_ptr instance = make_context();
    return instance.get();
  }

  auto make_keypair(const secret_key &key, scoped_keypair &out) -> void
  {
    if (secp256k1_keypair_create(context(), &out.value, key.data()) != 1) {
      throw std::invalid_argument("secret key out of range");
    }
  }

}// namespace

auto is_valid_secret_key(const secret_key &key) -> bool
{
  return secp256k1_ec_seckey_verify(context(), key.data()) == 1;
}

auto is_valid_public_key(const xonly_public_key &key) noexcept -> bool
{
  try {
    secp256k1_xonly_pubkey parsed;
    return secp256k1_xonly_pubkey_parse(context(), &parsed, key.data()) == 1;
  } catch (const std::exception &) {
    return false;
  }
}

auto derive_public_key(const secret_key &key) -> xonly_public_key
{
  scoped_keypair keypair;
  make_keypair(key, keypair);

  secp256k1_xonly_pubkey xonly;
  if (secp256k1_keypair_xonly_pub(context(), &xonly, nullptr, &keypair.value) != 1) {
    throw std::runtime_error("secp256k1_keypair_xonly_pub failed");
  }

  xonly_public_key out{};
  if (secp256k1_xonly_pubkey_serialize(context(), out.data(), &xonly) != 1) {
    throw std::runtime_error("secp256k1_xonly_pubkey_serialize failed");
  }
  return out;
}

auto sign(const secret_key &key, const digest &message, const aux_random &aux) -> signature
{
  scoped_keypair keypair;
  make_keypair(key, keypair);

  signature sig{};
  if (secp256k1_schnorrsig_sign32(context(), sig.data(), message.data(), &keypair.value, aux.data()) != 1) {
    throw std::runtime_error("secp256k1_schnorrsig_sign32 failed");
  }
  return sig;
}

auto sign(const secret_key &key, const digest &message) -> signature { return sign(key, message, aux_random{}); }

auto verify(const xonly_public_key &key, const digest &message, const signature &sig) noexcept -> bool
{
  try {
    secp256k1_xonly_pubkey parsed;
    if (secp256k1_xonly_pubkey_parse(context(), &parsed, key.data()) != 1) { return false; }
    return secp256k1_schnorrsig_verify(context(), sig.data(), message.data(), message.size(), &parsed) == 1;
  } catch (const std::exception &) {
    return false;
  }
}

}// namespace tidepool::crypto
