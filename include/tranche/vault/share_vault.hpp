#pragma once

#include <tranche/common/math.hpp>
#include <tranche/common/outcome.hpp>
#include <tranche/execution/context.hpp>
#include <tranche/hooks/hook_pipeline.hpp>
#include <tranche/hooks/operation_hook.hpp>
#include <tranche/schema/hook_entry.hpp>
#include <tranche/schema/operation_tag.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/vault_state.hpp>
#include <tranche/vault/asset_relay.hpp>
#include <tranche/vault/valuation_source.hpp>

#include <optional>
#include <vector>

namespace tranche::vault {

/// 1e18: prices and share valuations carry 18 decimals.
inline const auto kPriceScale = tranche::schema::amount_t{1'000'000'000'000'000'000ULL};

/// Account that holds a vault's idle underlying assets.
tranche::schema::account_id_t make_vault_custody_account(
    const tranche::schema::hash32_t& vault_id);

struct vault_environment final {
  asset_relay& relay;
  const tranche::hooks::hook_resolver& hooks;
  /// Null when the vault values its idle custody balance.
  const valuation_source* valuation{};
};

/// Proportional share accounting over one vault's persisted state.
///
/// Every balance-changing entry point runs its tag's hook list, then the
/// transfer hook list for the implied mint, burn or move, and only then
/// mutates balances. Validation failures leave the state untouched; later
/// failures rely on the caller discarding its working copy.
///
/// Exchange rate: shares = assets * (supply + 1) / (total_assets + 1).
/// Deposit and redeem previews round down, mint and withdraw previews round
/// up, so rounding always favours the vault.
class share_vault final {
 public:
  share_vault(tranche::schema::vault_state_t& state,
              vault_environment environment);

  share_vault(const share_vault&) = delete;
  share_vault& operator=(const share_vault&) = delete;

  const tranche::schema::vault_config_t& config() const;
  const tranche::schema::vault_state_t& state() const;

  tranche::schema::amount_t total_assets(
      tranche::schema::timestamp_seconds_t now) const;
  tranche::schema::amount_t total_supply() const;
  tranche::schema::amount_t balance_of(
      const tranche::schema::account_id_t& account) const;
  tranche::schema::amount_t allowance(
      const tranche::schema::account_id_t& owner,
      const tranche::schema::account_id_t& spender) const;

  tranche::schema::amount_t convert_to_shares(
      const tranche::schema::amount_t& assets,
      tranche::common::rounding mode,
      tranche::schema::timestamp_seconds_t now) const;
  tranche::schema::amount_t convert_to_assets(
      const tranche::schema::amount_t& shares,
      tranche::common::rounding mode,
      tranche::schema::timestamp_seconds_t now) const;

  tranche::schema::amount_t preview_deposit(
      const tranche::schema::amount_t& assets,
      tranche::schema::timestamp_seconds_t now) const;
  tranche::schema::amount_t preview_mint(
      const tranche::schema::amount_t& shares,
      tranche::schema::timestamp_seconds_t now) const;
  tranche::schema::amount_t preview_withdraw(
      const tranche::schema::amount_t& assets,
      tranche::schema::timestamp_seconds_t now) const;
  tranche::schema::amount_t preview_redeem(
      const tranche::schema::amount_t& shares,
      tranche::schema::timestamp_seconds_t now) const;

  tranche::schema::amount_t max_withdraw(
      const tranche::schema::account_id_t& owner,
      tranche::schema::timestamp_seconds_t now) const;
  tranche::schema::amount_t max_redeem(
      const tranche::schema::account_id_t& owner) const;

  /// Returns the shares minted. Disabled on gated vaults.
  tranche::common::outcome<tranche::schema::amount_t> deposit(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& assets,
      const tranche::schema::account_id_t& receiver);

  /// Returns the assets pulled. Disabled on gated vaults.
  tranche::common::outcome<tranche::schema::amount_t> mint(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& shares,
      const tranche::schema::account_id_t& receiver);

  /// Returns the shares burned. Disabled on managed vaults.
  tranche::common::outcome<tranche::schema::amount_t> withdraw(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& assets,
      const tranche::schema::account_id_t& receiver,
      const tranche::schema::account_id_t& owner);

  /// Returns the assets released. Operator only on managed vaults, where the
  /// operator also stands in for the owner's allowance.
  tranche::common::outcome<tranche::schema::amount_t> redeem(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& shares,
      const tranche::schema::account_id_t& receiver,
      const tranche::schema::account_id_t& owner,
      const std::optional<tranche::schema::amount_t>& min_assets);

  /// Managed vaults only. Each entry goes through `redeem`; the first failure
  /// aborts the batch. A zero floor means none. Returns the total released.
  tranche::common::outcome<tranche::schema::amount_t> batch_redeem(
      const tranche::execution::context_t& context,
      const std::vector<tranche::schema::amount_t>& shares,
      const std::vector<tranche::schema::account_id_t>& receivers,
      const std::vector<tranche::schema::account_id_t>& owners,
      const std::vector<tranche::schema::amount_t>& min_assets);

  /// Move shares; spends an allowance when the actor is not `from`.
  tranche::common::outcome<> transfer(
      const tranche::execution::context_t& context,
      const tranche::schema::account_id_t& from,
      const tranche::schema::account_id_t& to,
      const tranche::schema::amount_t& shares);

  tranche::common::outcome<> approve(
      const tranche::execution::context_t& context,
      const tranche::schema::account_id_t& spender,
      const tranche::schema::amount_t& shares);

  /// Gate for an escrowed deposit request: validates and runs the deposit
  /// hook list. Moves nothing; the escrow takes custody of the assets.
  tranche::common::outcome<> admit_deposit_request(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& assets,
      const tranche::schema::account_id_t& receiver);

  /// Privileged mint used by the escrow once the backing assets reached
  /// vault custody. Runs the transfer hook list for the mint.
  tranche::common::outcome<> mint_escrowed(
      const tranche::execution::context_t& context,
      const tranche::schema::account_id_t& recipient,
      const tranche::schema::amount_t& shares);

  /// Hook list management, manager only. Added hooks must be registered.
  tranche::common::outcome<> add_hook(
      const tranche::execution::context_t& context,
      tranche::schema::operation_tag_t tag,
      const tranche::schema::hash32_t& hook_id);
  tranche::common::outcome<> remove_hook(
      const tranche::execution::context_t& context,
      tranche::schema::operation_tag_t tag,
      uint32_t index);
  /// All or nothing: the first blocked removal aborts the batch.
  tranche::common::outcome<> remove_hooks(
      const tranche::execution::context_t& context,
      tranche::schema::operation_tag_t tag,
      const std::vector<uint32_t>& indices);
  tranche::common::outcome<> reorder_hooks(
      const tranche::execution::context_t& context,
      tranche::schema::operation_tag_t tag,
      const std::vector<uint32_t>& new_order);

  const std::vector<tranche::schema::hook_entry_t>& list_hooks(
      tranche::schema::operation_tag_t tag) const;
  uint64_t watermark(tranche::schema::operation_tag_t tag) const;

 private:
  tranche::common::outcome<> deposit_assets(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& assets,
      const tranche::schema::amount_t& shares,
      const tranche::schema::account_id_t& receiver);
  tranche::common::outcome<> withdraw_assets(
      const tranche::execution::context_t& context,
      const tranche::schema::amount_t& assets,
      const tranche::schema::amount_t& shares,
      const tranche::schema::account_id_t& receiver,
      const tranche::schema::account_id_t& owner);

  tranche::common::outcome<> run_hooks(
      const tranche::execution::context_t& context,
      tranche::schema::operation_tag_t tag,
      const tranche::schema::account_id_t& from,
      const tranche::schema::account_id_t& to,
      const tranche::schema::amount_t& assets,
      const tranche::schema::amount_t& shares);
  tranche::common::outcome<> spend_allowance(
      const tranche::schema::account_id_t& owner,
      const tranche::schema::account_id_t& spender,
      const tranche::schema::amount_t& shares);
  tranche::common::outcome<> require_manager(
      const tranche::execution::context_t& context) const;
  bool is_operator(const tranche::execution::context_t& context) const;

  tranche::schema::vault_state_t& state_;
  vault_environment environment_;
  tranche::hooks::hook_pipeline pipeline_;
  bool entered_{false};
};

}  // namespace tranche::vault
