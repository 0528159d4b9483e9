#include <timelock/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>

namespace timelock::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

evp_pkey_ptr make_private_key(const ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_signature(const timelock::schema::bytes_view_t& message,
                      const timelock::schema::account_id_t& signer,
                      const timelock::schema::signature_t& signature) {
  auto pkey = evp_pkey_ptr{EVP_PKEY_new_raw_public_key(
                               EVP_PKEY_ED25519, nullptr, signer.data(),
                               signer.size()),
                           EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<timelock::schema::account_id_t> public_key_from_seed(
    const ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = timelock::schema::account_id_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

std::optional<timelock::schema::signature_t> sign(
    const timelock::schema::bytes_view_t& message,
    const ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = timelock::schema::signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace timelock::crypto
