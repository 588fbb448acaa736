#pragma once
#include <tranche/schema/accept_deposit.hpp>
#include <tranche/schema/add_hook.hpp>
#include <tranche/schema/approve_shares.hpp>
#include <tranche/schema/batch_accept_deposits.hpp>
#include <tranche/schema/batch_redeem.hpp>
#include <tranche/schema/batch_refund_deposits.hpp>
#include <tranche/schema/create_oracle.hpp>
#include <tranche/schema/create_vault.hpp>
#include <tranche/schema/deposit.hpp>
#include <tranche/schema/execute_signed_withdrawals.hpp>
#include <tranche/schema/force_complete_transition.hpp>
#include <tranche/schema/issue_asset.hpp>
#include <tranche/schema/mint.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/reclaim_deposit.hpp>
#include <tranche/schema/redeem.hpp>
#include <tranche/schema/refund_deposit.hpp>
#include <tranche/schema/register_hook.hpp>
#include <tranche/schema/remove_hook.hpp>
#include <tranche/schema/remove_hooks.hpp>
#include <tranche/schema/reorder_hooks.hpp>
#include <tranche/schema/set_max_deviation.hpp>
#include <tranche/schema/set_oracle_updater.hpp>
#include <tranche/schema/transfer_shares.hpp>
#include <tranche/schema/transfer_shares_from.hpp>
#include <tranche/schema/update_allow_list.hpp>
#include <tranche/schema/update_price.hpp>
#include <tranche/schema/upsert_role_assignment.hpp>
#include <tranche/schema/withdraw.hpp>
#include <variant>

namespace tranche::schema {

using transaction_payload_t = std::variant<upsert_role_assignment_t,
                                           issue_asset_t,
                                           create_vault_t,
                                           register_hook_t,
                                           update_allow_list_t,
                                           add_hook_t,
                                           remove_hook_t,
                                           remove_hooks_t,
                                           reorder_hooks_t,
                                           deposit_t,
                                           mint_t,
                                           withdraw_t,
                                           redeem_t,
                                           batch_redeem_t,
                                           transfer_shares_t,
                                           transfer_shares_from_t,
                                           approve_shares_t,
                                           accept_deposit_t,
                                           batch_accept_deposits_t,
                                           refund_deposit_t,
                                           batch_refund_deposits_t,
                                           reclaim_deposit_t,
                                           create_oracle_t,
                                           update_price_t,
                                           set_max_deviation_t,
                                           force_complete_transition_t,
                                           set_oracle_updater_t,
                                           execute_signed_withdrawals_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace tranche::schema
