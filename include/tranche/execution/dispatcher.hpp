#pragma once

#include <tranche/common/outcome.hpp>
#include <tranche/execution/ledger_state.hpp>
#include <tranche/execution/signature_verifier.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction.hpp>
#include <tranche/schema/transaction_event.hpp>

#include <vector>

namespace tranche::execution {

struct dispatch_request final {
  tranche::schema::account_id_t actor{};
  tranche::schema::timestamp_seconds_t block_time{};
  /// Sequence of the running transaction, already reflected in the state.
  uint64_t sequence{};
  tranche::schema::hash32_t chain_id{};
  const signature_verifier_t& verifier;
};

/// Execute one payload against `state`.
///
/// On success returns the SCALE encoded result of the operation (minted
/// shares, released assets, new deposit id) or empty bytes. On failure
/// `state` may be partially updated and must be discarded by the caller.
tranche::common::outcome<tranche::schema::bytes_t> apply_payload(
    ledger_state& state,
    const dispatch_request& request,
    const tranche::schema::transaction_payload_t& payload,
    std::vector<tranche::schema::transaction_event_t>& events);

}  // namespace tranche::execution
