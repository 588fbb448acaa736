#pragma once

#include <tranche/common/outcome.hpp>
#include <tranche/execution/context.hpp>
#include <tranche/schema/pending_deposit.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/vault/asset_relay.hpp>
#include <tranche/vault/share_vault.hpp>

#include <vector>

namespace tranche::escrow {

/// Account that holds a gated vault's pending deposit assets.
tranche::schema::account_id_t make_escrow_custody_account(
    const tranche::schema::hash32_t& vault_id);

/// Id of a deposit request: BLAKE3 over the SCALE encoding of
/// (vault, depositor, recipient, amount, creation time, depositor sequence).
tranche::schema::hash32_t make_deposit_id(
    const tranche::schema::hash32_t& vault_id,
    const tranche::schema::account_id_t& depositor,
    const tranche::schema::account_id_t& recipient,
    const tranche::schema::amount_t& amount,
    tranche::schema::timestamp_seconds_t created_at,
    uint64_t depositor_sequence);

/// Two-phase deposit path of a gated vault.
///
/// Requests park assets in escrow custody as PENDING deposits. The operator
/// accepts (assets move to vault custody, shares are minted) or refunds
/// (assets return to the depositor). Each operator call advances the round
/// once; a depositor may reclaim a PENDING deposit after its expiration or
/// once the round moved past the one it was created in.
///
/// Ledger invariant after every call:
///   total_pending == sum(user_pending) == sum(amount of PENDING deposits)
class deposit_escrow final {
 public:
  deposit_escrow(tranche::schema::escrow_state_t& state,
                 tranche::vault::share_vault& vault,
                 tranche::vault::asset_relay& relay);

  deposit_escrow(const deposit_escrow&) = delete;
  deposit_escrow& operator=(const deposit_escrow&) = delete;

  /// Returns the new deposit id.
  tranche::common::outcome<tranche::schema::hash32_t> request_deposit(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& assets,
      const tranche::schema::account_id_t& receiver);

  tranche::common::outcome<> accept_deposit(
      const tranche::execution::context_t& context,
      const tranche::schema::hash32_t& deposit_id);
  tranche::common::outcome<> batch_accept_deposits(
      const tranche::execution::context_t& context,
      const std::vector<tranche::schema::hash32_t>& deposit_ids);

  tranche::common::outcome<> refund_deposit(
      const tranche::execution::context_t& context,
      const tranche::schema::hash32_t& deposit_id);
  tranche::common::outcome<> batch_refund_deposits(
      const tranche::execution::context_t& context,
      const std::vector<tranche::schema::hash32_t>& deposit_ids);

  /// Depositor only. Leaves the round untouched.
  tranche::common::outcome<> reclaim_deposit(
      const tranche::execution::context_t& context,
      const tranche::schema::hash32_t& deposit_id);

  const tranche::schema::pending_deposit_t* find(
      const tranche::schema::hash32_t& deposit_id) const;
  tranche::schema::amount_t total_pending() const;
  tranche::schema::amount_t user_pending(
      const tranche::schema::account_id_t& depositor) const;
  uint64_t round() const;

 private:
  enum class resolution : uint8_t { accept, refund };

  tranche::common::outcome<> resolve(
      const tranche::execution::context_t& context,
      const std::vector<tranche::schema::hash32_t>& deposit_ids,
      resolution kind,
      bool batch);
  tranche::common::outcome<std::vector<tranche::schema::pending_deposit_t*>>
  collect_pending(const std::vector<tranche::schema::hash32_t>& deposit_ids);
  tranche::schema::pending_deposit_t* find_mutable(
      const tranche::schema::hash32_t& deposit_id);
  uint64_t next_depositor_sequence(
      const tranche::schema::account_id_t& depositor);
  void release_from_ledger(const tranche::schema::pending_deposit_t& deposit);

  tranche::schema::escrow_state_t& state_;
  tranche::vault::share_vault& vault_;
  tranche::vault::asset_relay& relay_;
};

}  // namespace tranche::escrow
