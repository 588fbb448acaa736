#include <algorithm>
#include <array>
#include <memory>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <optional>
#include <tranche/crypto/verify.hpp>
#include <vector>

namespace tranche::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

constexpr auto kCompactSignatureSize = size_t{64};

// One-shot EVP verification. `digest` is null for ed25519, which hashes
// internally.
bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const tranche::schema::bytes_view_t& signature,
                   const tranche::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

evp_pkey_ptr make_ed25519_key(
    const tranche::schema::ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_key(
    const tranche::schema::secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_key, EVP_PKEY_free};
}

// 65 byte secp256k1 signatures carry a recovery id either in front
// ([v || r || s]) or at the back ([r || s || v]). v is 0..3 or 27 and above.
std::optional<std::array<uint8_t, kCompactSignatureSize>> strip_recovery_id(
    const tranche::schema::secp256k1_signature_t& signature) {
  const auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  auto compact = std::array<uint8_t, kCompactSignatureSize>{};
  if (is_recovery_id(signature.front())) {
    std::copy_n(signature.begin() + 1, compact.size(), compact.begin());
    return compact;
  }
  if (is_recovery_id(signature.back())) {
    std::copy_n(signature.begin(), compact.size(), compact.begin());
    return compact;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> to_der(
    const std::array<uint8_t, kCompactSignatureSize>& compact) {
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!sig || !r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto size = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (size <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(size));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &cursor) != size) {
    return std::nullopt;
  }
  return der;
}

bool verify_ed25519(const tranche::schema::bytes_view_t& message,
                    const tranche::schema::ed25519_signer_id& signer,
                    const tranche::schema::ed25519_signature_t& signature) {
  auto key = make_ed25519_key(signer);
  return key && digest_verify(key.get(), nullptr,
                              tranche::schema::bytes_view_t{signature},
                              message);
}

bool verify_secp256k1(const tranche::schema::bytes_view_t& message,
                      const tranche::schema::secp256k1_signer_id& signer,
                      const tranche::schema::secp256k1_signature_t& signature) {
  auto compact = strip_recovery_id(signature);
  if (!compact) {
    return false;
  }
  auto der = to_der(*compact);
  if (!der) {
    return false;
  }
  auto key = make_secp256k1_key(signer);
  return key && digest_verify(key.get(), EVP_sha256(),
                              tranche::schema::bytes_view_t{*der}, message);
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const tranche::schema::bytes_view_t& message,
                      const tranche::schema::signer_id_t& signer,
                      const tranche::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const tranche::schema::ed25519_signer_id& key) {
            const auto* sig =
                std::get_if<tranche::schema::ed25519_signature_t>(&signature);
            return sig != nullptr && verify_ed25519(message, key, *sig);
          },
          [&](const tranche::schema::secp256k1_signer_id& key) {
            const auto* sig =
                std::get_if<tranche::schema::secp256k1_signature_t>(&signature);
            return sig != nullptr && verify_secp256k1(message, key, *sig);
          },
          [](const tranche::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace tranche::crypto
