#pragma once

#include <tranche/schema/asset_balance.hpp>
#include <tranche/schema/hook_record.hpp>
#include <tranche/schema/oracle_state.hpp>
#include <tranche/schema/pending_deposit.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/role_assignment.hpp>
#include <tranche/schema/vault_state.hpp>
#include <tranche/schema/withdrawal_request.hpp>

#include <cstdint>
#include <map>
#include <vector>

namespace tranche::execution {

/// Complete in-memory ledger. A transaction runs against a copy and the
/// copy replaces the original only when every step succeeded.
struct ledger_state final {
  /// Operation sequence of the last successful transaction. 0 before any.
  uint64_t sequence{};
  std::map<tranche::schema::account_id_t, uint64_t> signer_nonces;
  std::vector<tranche::schema::role_assignment_t> roles;
  std::vector<tranche::schema::asset_balance_t> balances;
  std::map<tranche::schema::hash32_t, tranche::schema::vault_state_t> vaults;
  std::map<tranche::schema::hash32_t, tranche::schema::escrow_state_t> escrows;
  std::map<tranche::schema::hash32_t, tranche::schema::oracle_state_t> oracles;
  std::map<tranche::schema::hash32_t, tranche::schema::hook_record_t> hooks;
  std::map<tranche::schema::hash32_t, tranche::schema::withdrawal_nonce_state_t>
      withdrawal_nonces;
};

/// Vault and escrow custody accounts of every vault in `state`.
std::vector<tranche::schema::account_id_t> custody_accounts(
    const ledger_state& state);

}  // namespace tranche::execution
