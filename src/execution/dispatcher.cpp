#include <algorithm>
#include <memory>
#include <spdlog/spdlog.h>
#include <tranche/escrow/deposit_escrow.hpp>
#include <tranche/execution/authorization.hpp>
#include <tranche/execution/context.hpp>
#include <tranche/execution/dispatcher.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/hooks/allow_list_hook.hpp>
#include <tranche/hooks/hook_set.hpp>
#include <tranche/oracle/price_transition_oracle.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/vault/asset_relay.hpp>
#include <tranche/vault/share_vault.hpp>
#include <tranche/withdrawal/signed_withdrawal_authorizer.hpp>

using namespace tranche::schema;

namespace tranche::execution {

namespace {

using encoder_t = tranche::schema::encoding::encoder<
    tranche::schema::encoding::scale_encoder_tag>;
using tranche::common::failure;
using tranche::common::outcome;

/// Collaborators a vault operation needs, wired against one ledger state.
class vault_session final {
 public:
  vault_session(ledger_state& state, vault_state_t& vault)
      : assets_{state.balances, custody_accounts(state)},
        hooks_{state.hooks},
        oracle_{make_oracle(state, vault)},
        vault_{vault, tranche::vault::vault_environment{
                          .relay = assets_,
                          .hooks = hooks_,
                          .valuation = oracle_.get()}} {}

  tranche::vault::share_vault& vault() { return vault_; }
  tranche::vault::asset_ledger& assets() { return assets_; }

 private:
  static std::unique_ptr<tranche::oracle::price_transition_oracle> make_oracle(
      ledger_state& state,
      const vault_state_t& vault) {
    if (!vault.config.oracle_id) {
      return nullptr;
    }
    auto it = state.oracles.find(*vault.config.oracle_id);
    if (it == std::end(state.oracles)) {
      tranche::common::critical("vault bound to an unknown oracle");
    }
    return std::make_unique<tranche::oracle::price_transition_oracle>(
        it->second);
  }

  tranche::vault::asset_ledger assets_;
  tranche::hooks::hook_set hooks_;
  std::unique_ptr<tranche::oracle::price_transition_oracle> oracle_;
  tranche::vault::share_vault vault_;
};

failure missing_vault(const hash32_t& vault_id) {
  return failure{.code = transaction_error_code::vault_missing,
                 .reason = "vault " + to_hex(vault_id) + " not found"};
}

failure missing_oracle(const hash32_t& oracle_id) {
  return failure{.code = transaction_error_code::oracle_missing,
                 .reason = "oracle " + to_hex(oracle_id) + " not found"};
}

outcome<> require_role(const context_t& context,
                       const role_id_t role) {
  if (!context.authz.is_authorized(context.actor, role)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "caller lacks the " +
                             std::string{to_string(role)} + " role"};
  }
  return {};
}

template <typename T>
outcome<bytes_t> encoded(const outcome<T>& result) {
  if (!result.ok()) {
    return result.error();
  }
  auto encoder = encoder_t{};
  return encoder.encode(result.value);
}

outcome<bytes_t> without_data(const outcome<>& result) {
  if (!result.ok()) {
    return result.error();
  }
  return bytes_t{};
}

/// Payload handlers. Each one runs against the transaction's working copy.
class payload_executor final {
 public:
  payload_executor(ledger_state& state,
                   const dispatch_request& request,
                   std::vector<transaction_event_t>& events)
      : state_{state},
        request_{request},
        roles_{state.roles},
        context_{.actor = request.actor,
                 .now = request.block_time,
                 .sequence = request.sequence,
                 .authz = roles_,
                 .events = events} {}

  outcome<bytes_t> operator()(const upsert_role_assignment_t& payload) {
    if (auto allowed = require_role(context_, role_id_t::admin); !allowed.ok()) {
      return allowed.error();
    }
    if (is_null_account(payload.subject)) {
      return failure{.code = transaction_error_code::invalid_account,
                     .reason = "role subject must not be null"};
    }
    roles_.assign(payload.subject, payload.role, payload.enabled);
    emit(context_.events, "role_updated",
         {{"subject", to_attribute(payload.subject)},
          {"role", std::string{to_string(payload.role)}},
          {"enabled", payload.enabled ? "true" : "false"}});
    return bytes_t{};
  }

  outcome<bytes_t> operator()(const issue_asset_t& payload) {
    if (auto allowed = require_role(context_, role_id_t::admin); !allowed.ok()) {
      return allowed.error();
    }
    if (is_null_account(payload.asset_id)) {
      return failure{.code = transaction_error_code::invalid_identifier,
                     .reason = "asset id must not be null"};
    }
    if (is_null_account(payload.to)) {
      return failure{.code = transaction_error_code::invalid_account,
                     .reason = "asset recipient must not be null"};
    }
    if (payload.amount == 0) {
      return failure{.code = transaction_error_code::invalid_amount,
                     .reason = "issued amount must be greater than zero"};
    }
    auto ledger =
        tranche::vault::asset_ledger{state_.balances, custody_accounts(state_)};
    ledger.credit(payload.asset_id, payload.to, payload.amount);
    emit(context_.events, "asset_issued",
         {{"asset_id", to_attribute(payload.asset_id)},
          {"to", to_attribute(payload.to)},
          {"amount", to_attribute(payload.amount)}});
    return bytes_t{};
  }

  outcome<bytes_t> operator()(const create_vault_t& payload) {
    if (auto allowed = require_role(context_, role_id_t::admin); !allowed.ok()) {
      return allowed.error();
    }
    if (is_null_account(payload.vault_id) || is_null_account(payload.asset_id)) {
      return failure{.code = transaction_error_code::invalid_identifier,
                     .reason = "vault and asset ids must not be null"};
    }
    if (state_.vaults.contains(payload.vault_id)) {
      return failure{.code = transaction_error_code::vault_exists,
                     .reason = "vault already exists"};
    }
    if (payload.oracle_id && !state_.oracles.contains(*payload.oracle_id)) {
      return missing_oracle(*payload.oracle_id);
    }
    if (payload.gated_deposits && payload.deposit_expiration_seconds == 0) {
      return failure{.code = transaction_error_code::invalid_amount,
                     .reason = "gated vaults need a deposit expiration"};
    }

    auto vault = vault_state_t{};
    vault.config = vault_config_t{
        .vault_id = payload.vault_id,
        .asset_id = payload.asset_id,
        .gated_deposits = payload.gated_deposits,
        .managed_withdrawals = payload.managed_withdrawals,
        .oracle_id = payload.oracle_id,
        .deposit_expiration_seconds = payload.deposit_expiration_seconds};
    state_.vaults.emplace(payload.vault_id, std::move(vault));
    if (payload.gated_deposits) {
      auto escrow = escrow_state_t{};
      escrow.vault_id = payload.vault_id;
      state_.escrows.emplace(payload.vault_id, std::move(escrow));
    }
    if (payload.managed_withdrawals) {
      auto nonces = withdrawal_nonce_state_t{};
      nonces.vault_id = payload.vault_id;
      state_.withdrawal_nonces.emplace(payload.vault_id, std::move(nonces));
    }

    spdlog::info("Created vault {} (gated={}, managed={})",
                 to_hex(payload.vault_id), payload.gated_deposits,
                 payload.managed_withdrawals);
    emit(context_.events, "vault_created",
         {{"vault_id", to_attribute(payload.vault_id)},
          {"asset_id", to_attribute(payload.asset_id)},
          {"gated_deposits", payload.gated_deposits ? "true" : "false"},
          {"managed_withdrawals",
           payload.managed_withdrawals ? "true" : "false"}});
    return bytes_t{};
  }

  outcome<bytes_t> operator()(const register_hook_t& payload) {
    if (auto allowed = require_role(context_, role_id_t::manager);
        !allowed.ok()) {
      return allowed.error();
    }
    auto record = hook_record_t{.hook_id = payload.hook_id,
                                .config = payload.config};
    if (auto* allow_list = std::get_if<allow_list_hook_config_t>(&record.config)) {
      auto& accounts = allow_list->accounts;
      std::sort(std::begin(accounts), std::end(accounts));
      accounts.erase(std::unique(std::begin(accounts), std::end(accounts)),
                     std::end(accounts));
    }
    if (auto valid = tranche::hooks::validate_registration(state_.hooks, record);
        !valid.ok()) {
      return valid.error();
    }
    state_.hooks.emplace(record.hook_id, std::move(record));
    emit(context_.events, "hook_registered",
         {{"hook_id", to_attribute(payload.hook_id)}});
    return bytes_t{};
  }

  outcome<bytes_t> operator()(const update_allow_list_t& payload) {
    if (auto allowed = require_role(context_, role_id_t::manager);
        !allowed.ok()) {
      return allowed.error();
    }
    auto it = state_.hooks.find(payload.hook_id);
    if (it == std::end(state_.hooks)) {
      return failure{.code = transaction_error_code::hook_missing,
                     .reason = "hook " + to_hex(payload.hook_id) +
                               " is not registered"};
    }
    auto* config = std::get_if<allow_list_hook_config_t>(&it->second.config);
    if (config == nullptr) {
      return failure{.code = transaction_error_code::hook_type_mismatch,
                     .reason = "hook is not an allow list"};
    }
    if (is_null_account(payload.account)) {
      return failure{.code = transaction_error_code::invalid_account,
                     .reason = "listed account must not be null"};
    }
    tranche::hooks::set_listed(*config, payload.account, payload.listed);
    emit(context_.events, "allow_list_updated",
         {{"hook_id", to_attribute(payload.hook_id)},
          {"account", to_attribute(payload.account)},
          {"listed", payload.listed ? "true" : "false"}});
    return bytes_t{};
  }

  outcome<bytes_t> operator()(const add_hook_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(
          session.vault().add_hook(context_, payload.tag, payload.hook_id));
    });
  }

  outcome<bytes_t> operator()(const remove_hook_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(
          session.vault().remove_hook(context_, payload.tag, payload.index));
    });
  }

  outcome<bytes_t> operator()(const remove_hooks_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(
          session.vault().remove_hooks(context_, payload.tag, payload.indices));
    });
  }

  outcome<bytes_t> operator()(const reorder_hooks_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(session.vault().reorder_hooks(context_, payload.tag,
                                                 payload.new_order));
    });
  }

  outcome<bytes_t> operator()(const deposit_t& payload) {
    auto escrow_it = state_.escrows.find(payload.vault_id);
    return with_vault(payload.vault_id, [&](vault_session& session)
                                            -> outcome<bytes_t> {
      if (!session.vault().config().gated_deposits) {
        return encoded(
            session.vault().deposit(context_, payload.assets, payload.receiver));
      }
      if (escrow_it == std::end(state_.escrows)) {
        tranche::common::critical("gated vault without escrow state");
      }
      auto escrow = tranche::escrow::deposit_escrow{
          escrow_it->second, session.vault(), session.assets()};
      return encoded(
          escrow.request_deposit(context_, payload.assets, payload.receiver));
    });
  }

  outcome<bytes_t> operator()(const mint_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return encoded(
          session.vault().mint(context_, payload.shares, payload.receiver));
    });
  }

  outcome<bytes_t> operator()(const withdraw_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return encoded(session.vault().withdraw(context_, payload.assets,
                                              payload.receiver, payload.owner));
    });
  }

  outcome<bytes_t> operator()(const redeem_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return encoded(session.vault().redeem(context_, payload.shares,
                                            payload.receiver, payload.owner,
                                            payload.min_assets));
    });
  }

  outcome<bytes_t> operator()(const batch_redeem_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return encoded(session.vault().batch_redeem(
          context_, payload.shares, payload.receivers, payload.owners,
          payload.min_assets));
    });
  }

  outcome<bytes_t> operator()(const transfer_shares_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(session.vault().transfer(context_, context_.actor,
                                            payload.to, payload.shares));
    });
  }

  outcome<bytes_t> operator()(const transfer_shares_from_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(session.vault().transfer(context_, payload.from, payload.to,
                                            payload.shares));
    });
  }

  outcome<bytes_t> operator()(const approve_shares_t& payload) {
    return with_vault(payload.vault_id, [&](vault_session& session) {
      return without_data(
          session.vault().approve(context_, payload.spender, payload.shares));
    });
  }

  outcome<bytes_t> operator()(const accept_deposit_t& payload) {
    return with_escrow(payload.vault_id, [&](tranche::escrow::deposit_escrow& escrow) {
      return escrow.accept_deposit(context_, payload.deposit_id);
    });
  }

  outcome<bytes_t> operator()(const batch_accept_deposits_t& payload) {
    return with_escrow(payload.vault_id, [&](tranche::escrow::deposit_escrow& escrow) {
      return escrow.batch_accept_deposits(context_, payload.deposit_ids);
    });
  }

  outcome<bytes_t> operator()(const refund_deposit_t& payload) {
    return with_escrow(payload.vault_id, [&](tranche::escrow::deposit_escrow& escrow) {
      return escrow.refund_deposit(context_, payload.deposit_id);
    });
  }

  outcome<bytes_t> operator()(const batch_refund_deposits_t& payload) {
    return with_escrow(payload.vault_id, [&](tranche::escrow::deposit_escrow& escrow) {
      return escrow.batch_refund_deposits(context_, payload.deposit_ids);
    });
  }

  outcome<bytes_t> operator()(const reclaim_deposit_t& payload) {
    return with_escrow(payload.vault_id, [&](tranche::escrow::deposit_escrow& escrow) {
      return escrow.reclaim_deposit(context_, payload.deposit_id);
    });
  }

  outcome<bytes_t> operator()(const create_oracle_t& payload) {
    if (auto allowed = require_role(context_, role_id_t::admin); !allowed.ok()) {
      return allowed.error();
    }
    if (state_.oracles.contains(payload.oracle_id)) {
      return failure{.code = transaction_error_code::oracle_exists,
                     .reason = "oracle already exists"};
    }
    auto created = tranche::oracle::price_transition_oracle::create(
        context_, payload.oracle_id, payload.initial_price,
        payload.max_deviation_bps, payload.period_seconds);
    if (!created.ok()) {
      return created.error();
    }
    state_.oracles.emplace(payload.oracle_id, std::move(created.value));
    spdlog::info("Created oracle {} at price {}", to_hex(payload.oracle_id),
                 payload.initial_price.str());
    emit(context_.events, "oracle_created",
         {{"oracle_id", to_attribute(payload.oracle_id)},
          {"price", to_attribute(payload.initial_price)},
          {"max_deviation_bps", to_attribute(payload.max_deviation_bps)},
          {"period_seconds", to_attribute(payload.period_seconds)}});
    return bytes_t{};
  }

  outcome<bytes_t> operator()(const update_price_t& payload) {
    return with_oracle(payload.oracle_id,
                       [&](tranche::oracle::price_transition_oracle& oracle) {
                         return oracle.update(context_, payload.price,
                                              payload.source);
                       });
  }

  outcome<bytes_t> operator()(const set_max_deviation_t& payload) {
    return with_oracle(payload.oracle_id,
                       [&](tranche::oracle::price_transition_oracle& oracle) {
                         return oracle.set_max_deviation(
                             context_, payload.max_deviation_bps,
                             payload.period_seconds);
                       });
  }

  outcome<bytes_t> operator()(const force_complete_transition_t& payload) {
    return with_oracle(payload.oracle_id,
                       [&](tranche::oracle::price_transition_oracle& oracle) {
                         return oracle.force_complete_transition(context_);
                       });
  }

  outcome<bytes_t> operator()(const set_oracle_updater_t& payload) {
    return with_oracle(payload.oracle_id,
                       [&](tranche::oracle::price_transition_oracle& oracle) {
                         return oracle.set_updater(context_, payload.account,
                                                   payload.enabled);
                       });
  }

  outcome<bytes_t> operator()(const execute_signed_withdrawals_t& payload) {
    auto nonces = state_.withdrawal_nonces.find(payload.vault_id);
    return with_vault(payload.vault_id, [&](vault_session& session)
                                            -> outcome<bytes_t> {
      if (nonces == std::end(state_.withdrawal_nonces)) {
        return failure{.code = transaction_error_code::operation_disabled,
                       .reason = "signed withdrawals require a managed vault"};
      }
      auto authorizer = tranche::withdrawal::signed_withdrawal_authorizer{
          nonces->second, session.vault(), request_.chain_id,
          request_.verifier};
      return encoded(authorizer.execute(context_, payload.withdrawals));
    });
  }

 private:
  template <typename Fn>
  outcome<bytes_t> with_vault(const hash32_t& vault_id, Fn&& fn) {
    auto it = state_.vaults.find(vault_id);
    if (it == std::end(state_.vaults)) {
      return missing_vault(vault_id);
    }
    auto session = vault_session{state_, it->second};
    return fn(session);
  }

  template <typename Fn>
  outcome<bytes_t> with_escrow(const hash32_t& vault_id, Fn&& fn) {
    auto escrow_it = state_.escrows.find(vault_id);
    return with_vault(vault_id, [&](vault_session& session) -> outcome<bytes_t> {
      if (escrow_it == std::end(state_.escrows)) {
        return failure{.code = transaction_error_code::operation_disabled,
                       .reason = "vault does not escrow deposits"};
      }
      auto escrow = tranche::escrow::deposit_escrow{
          escrow_it->second, session.vault(), session.assets()};
      return without_data(fn(escrow));
    });
  }

  template <typename Fn>
  outcome<bytes_t> with_oracle(const hash32_t& oracle_id, Fn&& fn) {
    auto it = state_.oracles.find(oracle_id);
    if (it == std::end(state_.oracles)) {
      return missing_oracle(oracle_id);
    }
    auto oracle = tranche::oracle::price_transition_oracle{it->second};
    return without_data(fn(oracle));
  }

  ledger_state& state_;
  const dispatch_request& request_;
  role_book roles_;
  context_t context_;
};

}  // namespace

std::vector<account_id_t> custody_accounts(const ledger_state& state) {
  auto accounts = std::vector<account_id_t>{};
  accounts.reserve(state.vaults.size() * 2);
  for (const auto& [vault_id, vault] : state.vaults) {
    accounts.push_back(tranche::vault::make_vault_custody_account(vault_id));
    if (vault.config.gated_deposits) {
      accounts.push_back(tranche::escrow::make_escrow_custody_account(vault_id));
    }
  }
  return accounts;
}

outcome<bytes_t> apply_payload(ledger_state& state,
                               const dispatch_request& request,
                               const transaction_payload_t& payload,
                               std::vector<transaction_event_t>& events) {
  auto executor = payload_executor{state, request, events};
  return std::visit(executor, payload);
}

}  // namespace tranche::execution
