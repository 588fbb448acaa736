#pragma once

#include <tranche/schema/account_amount.hpp>
#include <tranche/schema/deposit_status.hpp>
#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: pending deposit.
// Lifecycle record of one escrowed deposit request, kept after resolution
// for audit.
namespace tranche::schema {

template <uint16_t Version>
struct pending_deposit;

template <>
struct pending_deposit<1> final {
  uint16_t version{1};
  hash32_t deposit_id{};
  account_id_t depositor{};
  account_id_t recipient{};
  amount_t amount{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expiration{};
  deposit_status_t status{deposit_status_t::pending};
  uint64_t round_at_creation{};
};

using pending_deposit_t = pending_deposit<1>;

template <uint16_t Version>
struct depositor_sequence;

template <>
struct depositor_sequence<1> final {
  uint16_t version{1};
  account_id_t depositor{};
  uint64_t next{};
};

using depositor_sequence_t = depositor_sequence<1>;

template <uint16_t Version>
struct escrow_state;

template <>
struct escrow_state<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  uint64_t round{};
  amount_t total_pending{};
  std::vector<account_amount_t> user_pending;
  std::vector<pending_deposit_t> deposits;
  std::vector<depositor_sequence_t> depositor_sequences;
};

using escrow_state_t = escrow_state<1>;

}  // namespace tranche::schema
