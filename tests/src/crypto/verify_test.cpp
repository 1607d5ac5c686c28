#include <dwn/crypto/sign.hpp>
#include <dwn/crypto/verify.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct secp_fixture_t final {
  dwn::schema::secp256k1_public_key_t public_key;
  // r || s
  std::array<uint8_t, 64> compact;
  std::vector<uint8_t> message;
};

std::optional<secp_fixture_t> make_secp_fixture() {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr) {
    return std::nullopt;
  }
  if (EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto compressed = std::array<uint8_t, 33>{};
  auto* pub_ptr = compressed.data();
  if (i2o_ECPublicKey(ec_key, &pub_ptr) !=
      static_cast<long>(compressed.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto pkey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>{
      EVP_PKEY_new(), EVP_PKEY_free};
  if (!pkey || EVP_PKEY_assign_EC_KEY(pkey.get(), ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto message = std::vector<uint8_t>{'d', 'e', 's', 'c', 'r', 'i', 'p', 't'};
  auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
      EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         pkey.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = der.data();
  auto* sig = d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size));
  if (sig == nullptr) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);
  auto compact = std::array<uint8_t, 64>{};
  auto ok_r = BN_bn2binpad(r, compact.data(), 32);
  auto ok_s = BN_bn2binpad(s, compact.data() + 32, 32);
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }

  return secp_fixture_t{
      .public_key = dwn::schema::secp256k1_public_key_t{.public_key = compressed},
      .compact = compact,
      .message = std::move(message)};
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures_from_sign) {
  if (!dwn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto pair = dwn::crypto::generate_ed25519_key_pair();
  ASSERT_TRUE(pair.has_value());

  auto message = std::vector<uint8_t>{'d', 'w', 'n'};
  auto signature = dwn::crypto::sign_ed25519(
      dwn::schema::bytes_view_t{message.data(), message.size()},
      pair->private_key);
  ASSERT_TRUE(signature.has_value());

  auto public_key = dwn::schema::public_key_t{pair->public_key};
  EXPECT_TRUE(dwn::crypto::verify_signature(
      dwn::schema::bytes_view_t{message.data(), message.size()}, public_key,
      dwn::schema::signature_t{*signature}));

  message[0] ^= 0x01;
  EXPECT_FALSE(dwn::crypto::verify_signature(
      dwn::schema::bytes_view_t{message.data(), message.size()}, public_key,
      dwn::schema::signature_t{*signature}));
}

TEST(crypto_verify, ed25519_key_pair_is_derived_from_the_seed) {
  if (!dwn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto generated = dwn::crypto::generate_ed25519_key_pair();
  ASSERT_TRUE(generated.has_value());
  auto rebuilt = dwn::crypto::make_ed25519_key_pair(generated->private_key);
  ASSERT_TRUE(rebuilt.has_value());
  EXPECT_EQ(rebuilt->public_key.public_key, generated->public_key.public_key);
}

TEST(crypto_verify, rejects_signatures_under_another_key) {
  if (!dwn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer = dwn::crypto::generate_ed25519_key_pair();
  auto other = dwn::crypto::generate_ed25519_key_pair();
  ASSERT_TRUE(signer.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = std::vector<uint8_t>{'k', 'e', 'y'};
  auto view = dwn::schema::bytes_view_t{message.data(), message.size()};
  auto signature = dwn::crypto::sign_ed25519(view, signer->private_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_FALSE(dwn::crypto::verify_signature(
      view, dwn::schema::public_key_t{other->public_key},
      dwn::schema::signature_t{*signature}));
}

TEST(crypto_verify, verifies_secp256k1_with_leading_recovery_byte) {
  if (!dwn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  auto view =
      dwn::schema::bytes_view_t{fixture->message.data(), fixture->message.size()};
  auto public_key = dwn::schema::public_key_t{fixture->public_key};

  auto leading = dwn::schema::secp256k1_signature_t{};
  leading[0] = 27;
  std::copy(std::begin(fixture->compact), std::end(fixture->compact),
            std::begin(leading) + 1);
  EXPECT_TRUE(dwn::crypto::verify_signature(view, public_key,
                                            dwn::schema::signature_t{leading}));
}

TEST(crypto_verify, verifies_secp256k1_with_trailing_recovery_byte) {
  if (!dwn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  // A trailing recovery id is only recognized when the first byte of r
  // cannot itself be read as one.
  auto fixture = std::optional<secp_fixture_t>{};
  for (auto attempt = 0; attempt < 512; ++attempt) {
    fixture = make_secp_fixture();
    ASSERT_TRUE(fixture.has_value());
    if (fixture->compact[0] > 3 && fixture->compact[0] < 27) {
      break;
    }
  }
  ASSERT_GT(fixture->compact[0], 3);
  ASSERT_LT(fixture->compact[0], 27);

  auto trailing = dwn::schema::secp256k1_signature_t{};
  std::copy(std::begin(fixture->compact), std::end(fixture->compact),
            std::begin(trailing));
  trailing[64] = 1;
  EXPECT_TRUE(dwn::crypto::verify_signature(
      dwn::schema::bytes_view_t{fixture->message.data(),
                                fixture->message.size()},
      dwn::schema::public_key_t{fixture->public_key},
      dwn::schema::signature_t{trailing}));
}

TEST(crypto_verify, mismatched_key_and_signature_types_fail) {
  auto public_key = dwn::schema::public_key_t{
      dwn::schema::secp256k1_public_key_t{}};
  auto message = std::vector<uint8_t>{'x'};
  EXPECT_FALSE(dwn::crypto::verify_signature(
      dwn::schema::bytes_view_t{message.data(), message.size()}, public_key,
      dwn::schema::signature_t{dwn::schema::ed25519_signature_t{}}));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
