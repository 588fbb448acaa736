#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: withdrawal request.
// Owner-signed authorization for an operator driven redemption.
namespace tranche::schema {

template <uint16_t Version>
struct withdrawal_request;

template <>
struct withdrawal_request<1> final {
  uint16_t version{1};
  account_id_t owner{};
  account_id_t to{};
  amount_t shares{};
  amount_t min_assets{};
  uint64_t nonce{};
  timestamp_seconds_t expiration{};
};

using withdrawal_request_t = withdrawal_request<1>;

template <uint16_t Version>
struct signed_withdrawal;

template <>
struct signed_withdrawal<1> final {
  uint16_t version{1};
  withdrawal_request_t request{};
  signer_id_t signer{};
  signature_t signature{};
};

using signed_withdrawal_t = signed_withdrawal<1>;

template <uint16_t Version>
struct used_withdrawal_nonce;

template <>
struct used_withdrawal_nonce<1> final {
  uint16_t version{1};
  account_id_t owner{};
  uint64_t nonce{};
};

using used_withdrawal_nonce_t = used_withdrawal_nonce<1>;

template <uint16_t Version>
struct withdrawal_nonce_state;

/// Append-only; entries are never removed, expired requests included.
template <>
struct withdrawal_nonce_state<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  std::vector<used_withdrawal_nonce_t> used;
};

using withdrawal_nonce_state_t = withdrawal_nonce_state<1>;

}  // namespace tranche::schema
