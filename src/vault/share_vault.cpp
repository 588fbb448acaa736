#include <algorithm>
#include <spdlog/spdlog.h>
#include <string_view>
#include <tranche/blake3/hash.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/vault/account_book.hpp>
#include <tranche/vault/share_vault.hpp>

namespace tranche::vault {

namespace {

using tranche::common::failure;
using tranche::common::outcome;
using tranche::execution::to_attribute;
using tranche::schema::account_id_t;
using tranche::schema::amount_t;
using tranche::schema::operation_tag_t;
using tranche::schema::transaction_error_code;

constexpr auto kVaultCustodyTag = std::string_view{"tranche.vault.custody"};

class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& entered) : entered_{entered} {
    entered_ = true;
  }
  ~reentrancy_guard() { entered_ = false; }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

 private:
  bool& entered_;
};

failure reentrant() {
  return failure{.code = transaction_error_code::reentrant_call,
                 .reason = "vault operation already in progress"};
}

auto find_allowance(std::vector<tranche::schema::share_allowance_t>& allowances,
                    const account_id_t& owner,
                    const account_id_t& spender) {
  return std::lower_bound(
      std::begin(allowances), std::end(allowances),
      std::pair{owner, spender},
      [](const tranche::schema::share_allowance_t& row,
         const std::pair<account_id_t, account_id_t>& key) {
        return std::pair{row.owner, row.spender} < key;
      });
}

outcome<> validate_account(const account_id_t& account, std::string_view what) {
  if (tranche::schema::is_null_account(account)) {
    return failure{.code = transaction_error_code::invalid_account,
                   .reason = std::string{what} + " must not be the null account"};
  }
  return {};
}

outcome<> validate_amount(const amount_t& amount, std::string_view what) {
  if (amount == 0) {
    return failure{.code = transaction_error_code::invalid_amount,
                   .reason = std::string{what} + " must be greater than zero"};
  }
  return {};
}

}  // namespace

account_id_t make_vault_custody_account(
    const tranche::schema::hash32_t& vault_id) {
  return tranche::blake3::hash(
      {tranche::schema::make_bytes_view(kVaultCustodyTag),
       tranche::schema::bytes_view_t{vault_id}});
}

share_vault::share_vault(tranche::schema::vault_state_t& state,
                         vault_environment environment)
    : state_{state}, environment_{environment}, pipeline_{state.hooks} {}

const tranche::schema::vault_config_t& share_vault::config() const {
  return state_.config;
}

const tranche::schema::vault_state_t& share_vault::state() const {
  return state_;
}

amount_t share_vault::total_assets(
    const tranche::schema::timestamp_seconds_t now) const {
  if (environment_.valuation == nullptr) {
    return environment_.relay.balance_of(
        state_.config.asset_id,
        make_vault_custody_account(state_.config.vault_id));
  }
  auto report = environment_.valuation->report(now);
  auto price =
      tranche::schema::decode_uint256(tranche::schema::bytes_view_t{report});
  if (!price) {
    tranche::common::critical("valuation source returned a malformed report");
  }
  return tranche::common::mul_div(state_.total_supply, *price, kPriceScale,
                                  tranche::common::rounding::down);
}

amount_t share_vault::total_supply() const {
  return state_.total_supply;
}

amount_t share_vault::balance_of(const account_id_t& account) const {
  return amount_of(state_.balances, account);
}

amount_t share_vault::allowance(const account_id_t& owner,
                                const account_id_t& spender) const {
  auto it = std::find_if(
      std::begin(state_.allowances), std::end(state_.allowances),
      [&](const auto& row) { return row.owner == owner && row.spender == spender; });
  if (it == std::end(state_.allowances)) {
    return 0;
  }
  return it->shares;
}

amount_t share_vault::convert_to_shares(
    const amount_t& assets,
    const tranche::common::rounding mode,
    const tranche::schema::timestamp_seconds_t now) const {
  return tranche::common::mul_div(assets, state_.total_supply + 1,
                                  total_assets(now) + 1, mode);
}

amount_t share_vault::convert_to_assets(
    const amount_t& shares,
    const tranche::common::rounding mode,
    const tranche::schema::timestamp_seconds_t now) const {
  return tranche::common::mul_div(shares, total_assets(now) + 1,
                                  state_.total_supply + 1, mode);
}

amount_t share_vault::preview_deposit(
    const amount_t& assets,
    const tranche::schema::timestamp_seconds_t now) const {
  return convert_to_shares(assets, tranche::common::rounding::down, now);
}

amount_t share_vault::preview_mint(
    const amount_t& shares,
    const tranche::schema::timestamp_seconds_t now) const {
  return convert_to_assets(shares, tranche::common::rounding::up, now);
}

amount_t share_vault::preview_withdraw(
    const amount_t& assets,
    const tranche::schema::timestamp_seconds_t now) const {
  return convert_to_shares(assets, tranche::common::rounding::up, now);
}

amount_t share_vault::preview_redeem(
    const amount_t& shares,
    const tranche::schema::timestamp_seconds_t now) const {
  return convert_to_assets(shares, tranche::common::rounding::down, now);
}

amount_t share_vault::max_withdraw(
    const account_id_t& owner,
    const tranche::schema::timestamp_seconds_t now) const {
  return convert_to_assets(balance_of(owner), tranche::common::rounding::down,
                           now);
}

amount_t share_vault::max_redeem(const account_id_t& owner) const {
  return balance_of(owner);
}

outcome<amount_t> share_vault::deposit(
    const tranche::execution::context_t& context,
    const amount_t& assets,
    const account_id_t& receiver) {
  if (state_.config.gated_deposits) {
    return failure{.code = transaction_error_code::operation_disabled,
                   .reason = "direct deposits are disabled on gated vaults"};
  }
  if (entered_) {
    return reentrant();
  }
  auto guard = reentrancy_guard{entered_};

  if (auto valid = validate_amount(assets, "assets"); !valid.ok()) {
    return valid.error();
  }
  if (auto valid = validate_account(receiver, "receiver"); !valid.ok()) {
    return valid.error();
  }
  auto shares = preview_deposit(assets, context.now);
  if (shares == 0) {
    return failure{.code = transaction_error_code::zero_shares,
                   .reason = "deposit would mint no shares"};
  }
  if (auto result = deposit_assets(context, assets, shares, receiver);
      !result.ok()) {
    return result.error();
  }
  return shares;
}

outcome<amount_t> share_vault::mint(
    const tranche::execution::context_t& context,
    const amount_t& shares,
    const account_id_t& receiver) {
  if (state_.config.gated_deposits) {
    return failure{.code = transaction_error_code::operation_disabled,
                   .reason = "direct mints are disabled on gated vaults"};
  }
  if (entered_) {
    return reentrant();
  }
  auto guard = reentrancy_guard{entered_};

  if (auto valid = validate_amount(shares, "shares"); !valid.ok()) {
    return valid.error();
  }
  if (auto valid = validate_account(receiver, "receiver"); !valid.ok()) {
    return valid.error();
  }
  auto assets = preview_mint(shares, context.now);
  if (auto result = deposit_assets(context, assets, shares, receiver);
      !result.ok()) {
    return result.error();
  }
  return assets;
}

outcome<amount_t> share_vault::withdraw(
    const tranche::execution::context_t& context,
    const amount_t& assets,
    const account_id_t& receiver,
    const account_id_t& owner) {
  if (state_.config.managed_withdrawals) {
    return failure{.code = transaction_error_code::operation_disabled,
                   .reason = "withdraw is disabled on managed vaults"};
  }
  if (entered_) {
    return reentrant();
  }
  auto guard = reentrancy_guard{entered_};

  if (auto valid = validate_amount(assets, "assets"); !valid.ok()) {
    return valid.error();
  }
  if (auto valid = validate_account(receiver, "receiver"); !valid.ok()) {
    return valid.error();
  }
  if (auto valid = validate_account(owner, "owner"); !valid.ok()) {
    return valid.error();
  }
  if (assets > max_withdraw(owner, context.now)) {
    return failure{.code = transaction_error_code::exceeds_max_withdraw,
                   .reason = "withdrawal exceeds the owner's redeemable assets"};
  }
  auto shares = preview_withdraw(assets, context.now);
  if (auto result = withdraw_assets(context, assets, shares, receiver, owner);
      !result.ok()) {
    return result.error();
  }
  return shares;
}

outcome<amount_t> share_vault::redeem(
    const tranche::execution::context_t& context,
    const amount_t& shares,
    const account_id_t& receiver,
    const account_id_t& owner,
    const std::optional<amount_t>& min_assets) {
  if (state_.config.managed_withdrawals && !is_operator(context)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "redeem on a managed vault requires the operator"};
  }
  if (entered_) {
    return reentrant();
  }
  auto guard = reentrancy_guard{entered_};

  if (auto valid = validate_amount(shares, "shares"); !valid.ok()) {
    return valid.error();
  }
  if (auto valid = validate_account(receiver, "receiver"); !valid.ok()) {
    return valid.error();
  }
  if (auto valid = validate_account(owner, "owner"); !valid.ok()) {
    return valid.error();
  }
  if (shares > max_redeem(owner)) {
    return failure{.code = transaction_error_code::exceeds_max_redeem,
                   .reason = "redemption exceeds the owner's shares"};
  }
  auto assets = preview_redeem(shares, context.now);
  if (assets == 0) {
    return failure{.code = transaction_error_code::invalid_amount,
                   .reason = "redemption would release no assets"};
  }
  if (min_assets.has_value() && assets < *min_assets) {
    return failure{
        .code = transaction_error_code::insufficient_output_assets,
        .reason = "redemption yields " + assets.str() +
                  " assets, below the floor of " + min_assets->str()};
  }
  if (auto result = withdraw_assets(context, assets, shares, receiver, owner);
      !result.ok()) {
    return result.error();
  }
  return assets;
}

outcome<amount_t> share_vault::batch_redeem(
    const tranche::execution::context_t& context,
    const std::vector<amount_t>& shares,
    const std::vector<account_id_t>& receivers,
    const std::vector<account_id_t>& owners,
    const std::vector<amount_t>& min_assets) {
  if (!state_.config.managed_withdrawals) {
    return failure{.code = transaction_error_code::operation_disabled,
                   .reason = "batch redeem requires a managed vault"};
  }
  if (!is_operator(context)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "batch redeem requires the operator"};
  }
  if (shares.empty() || shares.size() != receivers.size() ||
      shares.size() != owners.size() || shares.size() != min_assets.size()) {
    return failure{.code = transaction_error_code::invalid_array_lengths,
                   .reason = "batch redeem arrays must be non-empty and of "
                             "equal length"};
  }

  auto total = amount_t{0};
  for (size_t i = 0; i < shares.size(); ++i) {
    auto floor = min_assets[i] == 0 ? std::optional<amount_t>{}
                                    : std::optional<amount_t>{min_assets[i]};
    auto redeemed = redeem(context, shares[i], receivers[i], owners[i], floor);
    if (!redeemed.ok()) {
      spdlog::debug("batch redeem aborted at entry {}", i);
      return redeemed.error();
    }
    total += redeemed.value;
  }
  return total;
}

outcome<> share_vault::transfer(const tranche::execution::context_t& context,
                                const account_id_t& from,
                                const account_id_t& to,
                                const amount_t& shares) {
  if (entered_) {
    return reentrant();
  }
  auto guard = reentrancy_guard{entered_};

  if (auto valid = validate_amount(shares, "shares"); !valid.ok()) {
    return valid;
  }
  if (auto valid = validate_account(from, "sender"); !valid.ok()) {
    return valid;
  }
  if (auto valid = validate_account(to, "recipient"); !valid.ok()) {
    return valid;
  }
  if (balance_of(from) < shares) {
    return failure{.code = transaction_error_code::insufficient_balance,
                   .reason = "sender holds fewer shares than transferred"};
  }

  auto assets =
      convert_to_assets(shares, tranche::common::rounding::down, context.now);
  if (auto hooks = run_hooks(context, operation_tag_t::transfer, from, to,
                             assets, shares);
      !hooks.ok()) {
    return hooks;
  }
  if (context.actor != from) {
    if (auto spent = spend_allowance(from, context.actor, shares); !spent.ok()) {
      return spent;
    }
  }

  subtract_amount(state_.balances, from, shares);
  add_amount(state_.balances, to, shares);
  pipeline_.record_execution(operation_tag_t::transfer, context.sequence);

  tranche::execution::emit(context.events, "vault_transfer",
                           {{"vault_id", to_attribute(state_.config.vault_id)},
                            {"from", to_attribute(from)},
                            {"to", to_attribute(to)},
                            {"shares", to_attribute(shares)}});
  return {};
}

outcome<> share_vault::approve(const tranche::execution::context_t& context,
                               const account_id_t& spender,
                               const amount_t& shares) {
  if (auto valid = validate_account(spender, "spender"); !valid.ok()) {
    return valid;
  }

  auto it = find_allowance(state_.allowances, context.actor, spender);
  auto found = it != std::end(state_.allowances) &&
               it->owner == context.actor && it->spender == spender;
  if (shares == 0) {
    if (found) {
      state_.allowances.erase(it);
    }
  } else if (found) {
    it->shares = shares;
  } else {
    state_.allowances.insert(
        it, tranche::schema::share_allowance_t{
                .owner = context.actor, .spender = spender, .shares = shares});
  }

  tranche::execution::emit(context.events, "vault_approval",
                           {{"vault_id", to_attribute(state_.config.vault_id)},
                            {"owner", to_attribute(context.actor)},
                            {"spender", to_attribute(spender)},
                            {"shares", to_attribute(shares)}});
  return {};
}

outcome<> share_vault::admit_deposit_request(
    const tranche::execution::context_t& context,
    const amount_t& assets,
    const account_id_t& receiver) {
  if (entered_) {
    return reentrant();
  }
  auto guard = reentrancy_guard{entered_};

  if (auto valid = validate_amount(assets, "assets"); !valid.ok()) {
    return valid;
  }
  if (auto valid = validate_account(receiver, "receiver"); !valid.ok()) {
    return valid;
  }
  auto shares = preview_deposit(assets, context.now);
  if (auto hooks = run_hooks(context, operation_tag_t::deposit, context.actor,
                             receiver, assets, shares);
      !hooks.ok()) {
    return hooks;
  }
  pipeline_.record_execution(operation_tag_t::deposit, context.sequence);
  return {};
}

outcome<> share_vault::mint_escrowed(
    const tranche::execution::context_t& context,
    const account_id_t& recipient,
    const amount_t& shares) {
  if (shares == 0) {
    return {};
  }
  if (auto valid = validate_account(recipient, "recipient"); !valid.ok()) {
    return valid;
  }
  auto assets =
      convert_to_assets(shares, tranche::common::rounding::down, context.now);
  if (auto hooks = run_hooks(context, operation_tag_t::transfer,
                             account_id_t{}, recipient, assets, shares);
      !hooks.ok()) {
    return hooks;
  }

  add_amount(state_.balances, recipient, shares);
  state_.total_supply += shares;
  pipeline_.record_execution(operation_tag_t::transfer, context.sequence);

  tranche::execution::emit(context.events, "vault_mint",
                           {{"vault_id", to_attribute(state_.config.vault_id)},
                            {"recipient", to_attribute(recipient)},
                            {"shares", to_attribute(shares)}});
  return {};
}

outcome<> share_vault::add_hook(const tranche::execution::context_t& context,
                                const operation_tag_t tag,
                                const tranche::schema::hash32_t& hook_id) {
  if (auto allowed = require_manager(context); !allowed.ok()) {
    return allowed;
  }
  if (!tranche::schema::is_null_account(hook_id) &&
      environment_.hooks.find(hook_id) == nullptr) {
    return failure{.code = transaction_error_code::hook_missing,
                   .reason = "hook is not registered"};
  }
  if (auto added = pipeline_.add_hook(tag, hook_id, context.sequence);
      !added.ok()) {
    return added;
  }

  tranche::execution::emit(
      context.events, "hook_added",
      {{"vault_id", to_attribute(state_.config.vault_id)},
       {"tag", std::string{tranche::schema::to_string(tag)}},
       {"hook_id", to_attribute(hook_id)},
       {"index", to_attribute(static_cast<uint64_t>(
                     pipeline_.list_hooks(tag).size() - 1))}});
  return {};
}

outcome<> share_vault::remove_hook(const tranche::execution::context_t& context,
                                   const operation_tag_t tag,
                                   const uint32_t index) {
  if (auto allowed = require_manager(context); !allowed.ok()) {
    return allowed;
  }
  auto removed = pipeline_.remove_hook(tag, index);
  if (!removed.ok()) {
    return removed.error();
  }

  tranche::execution::emit(
      context.events, "hook_removed",
      {{"vault_id", to_attribute(state_.config.vault_id)},
       {"tag", std::string{tranche::schema::to_string(tag)}},
       {"hook_id", to_attribute(removed.value.hook_id)},
       {"index", to_attribute(static_cast<uint64_t>(index))}});
  return {};
}

outcome<> share_vault::remove_hooks(
    const tranche::execution::context_t& context,
    const operation_tag_t tag,
    const std::vector<uint32_t>& indices) {
  if (auto allowed = require_manager(context); !allowed.ok()) {
    return allowed;
  }
  if (indices.empty()) {
    return failure{.code = transaction_error_code::invalid_array_lengths,
                   .reason = "no hook indices given"};
  }

  // Indices apply one after another against the list as it shrinks.
  auto snapshot = state_.hooks;
  auto removed = std::vector<tranche::schema::hook_entry_t>{};
  for (const auto index : indices) {
    auto entry = pipeline_.remove_hook(tag, index);
    if (!entry.ok()) {
      state_.hooks = std::move(snapshot);
      return entry.error();
    }
    removed.push_back(entry.value);
  }

  for (size_t i = 0; i < removed.size(); ++i) {
    tranche::execution::emit(
        context.events, "hook_removed",
        {{"vault_id", to_attribute(state_.config.vault_id)},
         {"tag", std::string{tranche::schema::to_string(tag)}},
         {"hook_id", to_attribute(removed[i].hook_id)},
         {"index", to_attribute(static_cast<uint64_t>(indices[i]))}});
  }
  return {};
}

outcome<> share_vault::reorder_hooks(
    const tranche::execution::context_t& context,
    const operation_tag_t tag,
    const std::vector<uint32_t>& new_order) {
  if (auto allowed = require_manager(context); !allowed.ok()) {
    return allowed;
  }
  if (auto reordered = pipeline_.reorder(tag, new_order); !reordered.ok()) {
    return reordered;
  }

  tranche::execution::emit(
      context.events, "hooks_reordered",
      {{"vault_id", to_attribute(state_.config.vault_id)},
       {"tag", std::string{tranche::schema::to_string(tag)}},
       {"count", to_attribute(static_cast<uint64_t>(new_order.size()))}});
  return {};
}

const std::vector<tranche::schema::hook_entry_t>& share_vault::list_hooks(
    const operation_tag_t tag) const {
  return pipeline_.list_hooks(tag);
}

uint64_t share_vault::watermark(const operation_tag_t tag) const {
  return pipeline_.watermark(tag);
}

outcome<> share_vault::deposit_assets(
    const tranche::execution::context_t& context,
    const amount_t& assets,
    const amount_t& shares,
    const account_id_t& receiver) {
  if (auto hooks = run_hooks(context, operation_tag_t::deposit, context.actor,
                             receiver, assets, shares);
      !hooks.ok()) {
    return hooks;
  }
  if (auto hooks = run_hooks(context, operation_tag_t::transfer,
                             account_id_t{}, receiver, assets, shares);
      !hooks.ok()) {
    return hooks;
  }

  auto custody = make_vault_custody_account(state_.config.vault_id);
  if (!environment_.relay.pull(state_.config.asset_id, context.actor, custody,
                               assets)) {
    return failure{.code = transaction_error_code::asset_transfer_failed,
                   .reason = "could not pull " + assets.str() +
                             " assets into vault custody"};
  }

  add_amount(state_.balances, receiver, shares);
  state_.total_supply += shares;
  pipeline_.record_execution(operation_tag_t::deposit, context.sequence);
  pipeline_.record_execution(operation_tag_t::transfer, context.sequence);

  spdlog::debug("vault {} deposit of {} assets minted {} shares",
                tranche::schema::to_hex(state_.config.vault_id), assets.str(),
                shares.str());
  tranche::execution::emit(context.events, "vault_deposit",
                           {{"vault_id", to_attribute(state_.config.vault_id)},
                            {"sender", to_attribute(context.actor)},
                            {"receiver", to_attribute(receiver)},
                            {"assets", to_attribute(assets)},
                            {"shares", to_attribute(shares)}});
  return {};
}

outcome<> share_vault::withdraw_assets(
    const tranche::execution::context_t& context,
    const amount_t& assets,
    const amount_t& shares,
    const account_id_t& receiver,
    const account_id_t& owner) {
  if (auto hooks = run_hooks(context, operation_tag_t::withdraw, owner,
                             receiver, assets, shares);
      !hooks.ok()) {
    return hooks;
  }
  if (auto hooks = run_hooks(context, operation_tag_t::transfer, owner,
                             account_id_t{}, assets, shares);
      !hooks.ok()) {
    return hooks;
  }

  auto operator_managed =
      state_.config.managed_withdrawals && is_operator(context);
  auto spends_allowance = context.actor != owner && !operator_managed;
  if (spends_allowance && allowance(owner, context.actor) < shares) {
    return failure{.code = transaction_error_code::insufficient_allowance,
                   .reason = "spender allowance does not cover " +
                             shares.str() + " shares"};
  }
  if (balance_of(owner) < shares) {
    return failure{.code = transaction_error_code::insufficient_balance,
                   .reason = "owner holds fewer shares than required"};
  }

  // Assets leave custody before any share book changes.
  auto custody = make_vault_custody_account(state_.config.vault_id);
  if (!environment_.relay.pull(state_.config.asset_id, custody, receiver,
                               assets)) {
    return failure{.code = transaction_error_code::asset_transfer_failed,
                   .reason = "vault custody cannot release " + assets.str() +
                             " assets"};
  }
  if (spends_allowance) {
    if (auto spent = spend_allowance(owner, context.actor, shares);
        !spent.ok()) {
      return spent;
    }
  }
  subtract_amount(state_.balances, owner, shares);
  state_.total_supply -= shares;

  pipeline_.record_execution(operation_tag_t::withdraw, context.sequence);
  pipeline_.record_execution(operation_tag_t::transfer, context.sequence);

  spdlog::debug("vault {} burned {} shares for {} assets",
                tranche::schema::to_hex(state_.config.vault_id), shares.str(),
                assets.str());
  tranche::execution::emit(context.events, "vault_withdraw",
                           {{"vault_id", to_attribute(state_.config.vault_id)},
                            {"sender", to_attribute(context.actor)},
                            {"receiver", to_attribute(receiver)},
                            {"owner", to_attribute(owner)},
                            {"assets", to_attribute(assets)},
                            {"shares", to_attribute(shares)}});
  return {};
}

outcome<> share_vault::run_hooks(const tranche::execution::context_t& context,
                                 const operation_tag_t tag,
                                 const account_id_t& from,
                                 const account_id_t& to,
                                 const amount_t& assets,
                                 const amount_t& shares) {
  auto gate = tranche::hooks::hook_context{
      .tag = tag,
      .vault_id = state_.config.vault_id,
      .actor = context.actor,
      .from = from,
      .to = to,
      .assets = assets,
      .shares = shares,
      .total_assets = total_assets(context.now),
      .now = context.now};
  auto result = pipeline_.run_all(gate, environment_.hooks);
  if (!result.approved) {
    return failure{.code = transaction_error_code::hook_check_failed,
                   .reason = result.reason};
  }
  return {};
}

outcome<> share_vault::spend_allowance(const account_id_t& owner,
                                       const account_id_t& spender,
                                       const amount_t& shares) {
  auto it = find_allowance(state_.allowances, owner, spender);
  if (it == std::end(state_.allowances) || it->owner != owner ||
      it->spender != spender || it->shares < shares) {
    return failure{.code = transaction_error_code::insufficient_allowance,
                   .reason = "spender allowance does not cover " +
                             shares.str() + " shares"};
  }
  it->shares -= shares;
  if (it->shares == 0) {
    state_.allowances.erase(it);
  }
  return {};
}

outcome<> share_vault::require_manager(
    const tranche::execution::context_t& context) const {
  if (!context.authz.is_authorized(context.actor,
                                   tranche::schema::role_id_t::manager)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "hook management requires the manager role"};
  }
  return {};
}

bool share_vault::is_operator(
    const tranche::execution::context_t& context) const {
  return context.authz.is_authorized(
      context.actor, tranche::schema::role_id_t::vault_operator);
}

}  // namespace tranche::vault
