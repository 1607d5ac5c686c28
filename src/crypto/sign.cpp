#include <dwn/crypto/sign.hpp>

#include <openssl/evp.h>

#include <memory>

namespace dwn::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::optional<ed25519_key_pair> key_pair_of(EVP_PKEY* pkey) {
  auto pair = ed25519_key_pair{};
  auto private_size = pair.private_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey, pair.private_key.data(),
                                   &private_size) != 1 ||
      private_size != pair.private_key.size()) {
    return std::nullopt;
  }
  auto public_size = pair.public_key.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, pair.public_key.public_key.data(),
                                  &public_size) != 1 ||
      public_size != pair.public_key.public_key.size()) {
    return std::nullopt;
  }
  return pair;
}

}  // namespace

std::optional<ed25519_key_pair> generate_ed25519_key_pair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
  return key_pair_of(pkey.get());
}

std::optional<ed25519_key_pair> make_ed25519_key_pair(
    const ed25519_private_key_t& private_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  return key_pair_of(pkey.get());
}

std::optional<dwn::schema::ed25519_signature_t> sign_ed25519(
    const dwn::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }
  auto signature = dwn::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace dwn::crypto
