#pragma once

#include <tranche/common/outcome.hpp>
#include <tranche/execution/context.hpp>
#include <tranche/execution/signature_verifier.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/withdrawal_request.hpp>
#include <tranche/vault/share_vault.hpp>

#include <vector>

namespace tranche::withdrawal {

/// Typed-data digest an owner signs to authorize `request`. The domain binds
/// the chain and the vault, so a signature is never valid elsewhere.
tranche::schema::hash32_t make_withdrawal_digest(
    const tranche::schema::hash32_t& chain_id,
    const tranche::schema::hash32_t& vault_id,
    const tranche::schema::withdrawal_request_t& request);

/// Operator-submitted, owner-signed redemptions on a managed vault.
///
/// Each entry is checked for expiry, nonce reuse and signature in that
/// order, its nonce is burned, and the redemption then takes the vault's
/// normal hook-checked path. The first failing entry aborts the call.
class signed_withdrawal_authorizer final {
 public:
  signed_withdrawal_authorizer(tranche::schema::withdrawal_nonce_state_t& nonces,
                               tranche::vault::share_vault& vault,
                               const tranche::schema::hash32_t& chain_id,
                               tranche::execution::signature_verifier_t verifier);

  /// Returns the total assets released.
  tranche::common::outcome<tranche::schema::amount_t> execute(
      const tranche::execution::context_t& context,
      const std::vector<tranche::schema::signed_withdrawal_t>& withdrawals);

  bool is_nonce_used(const tranche::schema::account_id_t& owner,
                     uint64_t nonce) const;

 private:
  tranche::common::outcome<tranche::schema::amount_t> execute_one(
      const tranche::execution::context_t& context,
      const tranche::schema::signed_withdrawal_t& withdrawal);
  void mark_nonce_used(const tranche::schema::account_id_t& owner,
                       uint64_t nonce);

  tranche::schema::withdrawal_nonce_state_t& nonces_;
  tranche::vault::share_vault& vault_;
  tranche::schema::hash32_t chain_id_;
  tranche::execution::signature_verifier_t verifier_;
};

}  // namespace tranche::withdrawal
