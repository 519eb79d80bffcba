#include <crypto/sha256.hpp>

#include <memory>
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace tidepool::crypto {

namespace {
  using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

  auto make_md_ctx() -> md_ctx_ptr
  {
    md_ctx_ptr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (not ctx) { throw std::runtime_error("EVP_MD_CTX_new failed"); }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
  }

  auto update(EVP_MD_CTX *ctx, std::span<const std::uint8_t> data) -> void
  {
    if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) { throw std::runtime_error("EVP_DigestUpdate failed"); }
  }

  auto finish(EVP_MD_CTX *ctx) -> digest
  {
    digest out{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &length) != 1 or length != out.size()) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
  }
}// namespace

auto sha256(std::span<const std::uint8_t> data) -> digest
{
  auto ctx = make_md_ctx();
  update(ctx.get(), data);
  return finish(ctx.get());
}

auto sha256(std::string_view text) -> digest
{
  return sha256(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
}

auto tagged_hash(std::string_view tag, std::span<const std::uint8_t> data) -> digest
{
  const auto tag_hash = sha256(tag);
  auto ctx = make_md_ctx();
  update(ctx.get(), tag_hash);
  update(ctx.get(), tag_hash);
  update(ctx.get(), data);
  return finish(ctx.get());
}

}// namespace tidepool::crypto
