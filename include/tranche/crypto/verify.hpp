#pragma once

#include <tranche/schema/primitives.hpp>

namespace tranche::crypto {

/// True when the OpenSSL build exposes ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message`. secp256k1 verification hashes the
/// message with SHA-256; ed25519 signs the message directly. Named signers
/// carry no key material and never verify.
bool verify_signature(const tranche::schema::bytes_view_t& message,
                      const tranche::schema::signer_id_t& signer,
                      const tranche::schema::signature_t& signature);

}  // namespace tranche::crypto
