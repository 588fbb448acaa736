#include <algorithm>
#include <spdlog/spdlog.h>
#include <string_view>
#include <tranche/blake3/hash.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/common/math.hpp>
#include <tranche/escrow/deposit_escrow.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/vault/account_book.hpp>
#include <tuple>

namespace tranche::escrow {

namespace {

using tranche::common::failure;
using tranche::common::outcome;
using tranche::execution::to_attribute;
using tranche::schema::account_id_t;
using tranche::schema::amount_t;
using tranche::schema::deposit_status_t;
using tranche::schema::hash32_t;
using tranche::schema::pending_deposit_t;
using tranche::schema::transaction_error_code;

constexpr auto kEscrowCustodyTag = std::string_view{"tranche.escrow.custody"};

}  // namespace

account_id_t make_escrow_custody_account(const hash32_t& vault_id) {
  return tranche::blake3::hash(
      {tranche::schema::make_bytes_view(kEscrowCustodyTag),
       tranche::schema::bytes_view_t{vault_id}});
}

hash32_t make_deposit_id(const hash32_t& vault_id,
                         const account_id_t& depositor,
                         const account_id_t& recipient,
                         const amount_t& amount,
                         const tranche::schema::timestamp_seconds_t created_at,
                         const uint64_t depositor_sequence) {
  auto encoder = tranche::schema::encoding::encoder<
      tranche::schema::encoding::scale_encoder_tag>{};
  auto encoded = encoder.encode(std::tuple{vault_id, depositor, recipient,
                                           amount, created_at,
                                           depositor_sequence});
  return tranche::blake3::hash(tranche::schema::bytes_view_t{encoded});
}

deposit_escrow::deposit_escrow(tranche::schema::escrow_state_t& state,
                               tranche::vault::share_vault& vault,
                               tranche::vault::asset_relay& relay)
    : state_{state}, vault_{vault}, relay_{relay} {}

outcome<hash32_t> deposit_escrow::request_deposit(
    const tranche::execution::context_t& context,
    const amount_t& assets,
    const account_id_t& receiver) {
  if (auto admitted = vault_.admit_deposit_request(context, assets, receiver);
      !admitted.ok()) {
    return admitted.error();
  }

  const auto& config = vault_.config();
  if (!relay_.pull(config.asset_id, context.actor,
                   make_escrow_custody_account(config.vault_id), assets)) {
    return failure{.code = transaction_error_code::asset_transfer_failed,
                   .reason = "could not pull " + assets.str() +
                             " assets into escrow custody"};
  }

  auto sequence = next_depositor_sequence(context.actor);
  auto deposit = pending_deposit_t{
      .deposit_id = make_deposit_id(state_.vault_id, context.actor, receiver,
                                    assets, context.now, sequence),
      .depositor = context.actor,
      .recipient = receiver,
      .amount = assets,
      .created_at = context.now,
      .expiration = context.now + config.deposit_expiration_seconds,
      .status = deposit_status_t::pending,
      .round_at_creation = state_.round};
  if (find(deposit.deposit_id) != nullptr) {
    tranche::common::critical("deposit id collision");
  }

  state_.total_pending += assets;
  tranche::vault::add_amount(state_.user_pending, context.actor, assets);
  state_.deposits.push_back(deposit);

  tranche::execution::emit(
      context.events, "deposit_pending",
      {{"deposit_id", to_attribute(deposit.deposit_id)},
       {"vault_id", to_attribute(state_.vault_id)},
       {"depositor", to_attribute(deposit.depositor)},
       {"recipient", to_attribute(deposit.recipient)},
       {"amount", to_attribute(deposit.amount)},
       {"expiration", to_attribute(deposit.expiration)},
       {"round", to_attribute(deposit.round_at_creation)}});
  return deposit.deposit_id;
}

outcome<> deposit_escrow::accept_deposit(
    const tranche::execution::context_t& context,
    const hash32_t& deposit_id) {
  return resolve(context, {deposit_id}, resolution::accept, false);
}

outcome<> deposit_escrow::batch_accept_deposits(
    const tranche::execution::context_t& context,
    const std::vector<hash32_t>& deposit_ids) {
  return resolve(context, deposit_ids, resolution::accept, true);
}

outcome<> deposit_escrow::refund_deposit(
    const tranche::execution::context_t& context,
    const hash32_t& deposit_id) {
  return resolve(context, {deposit_id}, resolution::refund, false);
}

outcome<> deposit_escrow::batch_refund_deposits(
    const tranche::execution::context_t& context,
    const std::vector<hash32_t>& deposit_ids) {
  return resolve(context, deposit_ids, resolution::refund, true);
}

outcome<> deposit_escrow::reclaim_deposit(
    const tranche::execution::context_t& context,
    const hash32_t& deposit_id) {
  auto* deposit = find_mutable(deposit_id);
  if (deposit == nullptr) {
    return failure{.code = transaction_error_code::deposit_not_found,
                   .reason = "deposit not found"};
  }
  if (deposit->depositor != context.actor) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "only the depositor may reclaim"};
  }
  if (deposit->status != deposit_status_t::pending) {
    return failure{.code = transaction_error_code::deposit_not_pending,
                   .reason = "deposit is not pending"};
  }
  if (context.now < deposit->expiration &&
      state_.round <= deposit->round_at_creation) {
    return failure{.code = transaction_error_code::deposit_not_reclaimable,
                   .reason = "deposit is neither expired nor stale"};
  }

  if (!relay_.pull(vault_.config().asset_id,
                   make_escrow_custody_account(state_.vault_id),
                   deposit->depositor, deposit->amount)) {
    return failure{.code = transaction_error_code::asset_transfer_failed,
                   .reason = "escrow custody cannot return the deposit"};
  }
  deposit->status = deposit_status_t::refunded;
  release_from_ledger(*deposit);

  tranche::execution::emit(context.events, "deposit_reclaimed",
                           {{"deposit_id", to_attribute(deposit->deposit_id)},
                            {"vault_id", to_attribute(state_.vault_id)},
                            {"depositor", to_attribute(deposit->depositor)},
                            {"amount", to_attribute(deposit->amount)}});
  return {};
}

const pending_deposit_t* deposit_escrow::find(const hash32_t& deposit_id) const {
  auto it = std::find_if(
      std::begin(state_.deposits), std::end(state_.deposits),
      [&](const pending_deposit_t& row) { return row.deposit_id == deposit_id; });
  return it == std::end(state_.deposits) ? nullptr : &*it;
}

amount_t deposit_escrow::total_pending() const {
  return state_.total_pending;
}

amount_t deposit_escrow::user_pending(const account_id_t& depositor) const {
  return tranche::vault::amount_of(state_.user_pending, depositor);
}

uint64_t deposit_escrow::round() const {
  return state_.round;
}

outcome<> deposit_escrow::resolve(const tranche::execution::context_t& context,
                                  const std::vector<hash32_t>& deposit_ids,
                                  const resolution kind,
                                  const bool batch) {
  if (!context.authz.is_authorized(context.actor,
                                   tranche::schema::role_id_t::vault_operator)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "deposit resolution requires the operator"};
  }
  if (deposit_ids.empty()) {
    return failure{.code = transaction_error_code::invalid_array_lengths,
                   .reason = "no deposit ids given"};
  }
  auto collected = collect_pending(deposit_ids);
  if (!collected.ok()) {
    return collected.error();
  }
  auto& deposits = collected.value;

  auto total_assets = amount_t{0};
  for (const auto* deposit : deposits) {
    total_assets += deposit->amount;
  }

  const auto& config = vault_.config();
  auto escrow_custody = make_escrow_custody_account(state_.vault_id);
  auto vault_custody = tranche::vault::make_vault_custody_account(config.vault_id);
  auto total_shares = amount_t{0};
  auto minted = amount_t{0};

  if (kind == resolution::accept) {
    // One exchange rate for the whole call, taken before any asset moves.
    total_shares = vault_.preview_deposit(total_assets, context.now);
    if (total_shares == 0) {
      return failure{.code = transaction_error_code::zero_shares,
                     .reason = "accepted deposits would mint no shares at the "
                               "current exchange rate"};
    }
    for (auto* deposit : deposits) {
      auto shares = tranche::common::mul_div(deposit->amount, total_shares,
                                             total_assets,
                                             tranche::common::rounding::down);
      if (!relay_.pull(config.asset_id, escrow_custody, vault_custody,
                       deposit->amount)) {
        return failure{.code = transaction_error_code::asset_transfer_failed,
                       .reason = "escrow custody cannot fund the vault"};
      }
      deposit->status = deposit_status_t::accepted;
      release_from_ledger(*deposit);
      if (auto mint = vault_.mint_escrowed(context, deposit->recipient, shares);
          !mint.ok()) {
        return mint;
      }
      minted += shares;
      tranche::execution::emit(
          context.events, "deposit_accepted",
          {{"deposit_id", to_attribute(deposit->deposit_id)},
           {"vault_id", to_attribute(state_.vault_id)},
           {"recipient", to_attribute(deposit->recipient)},
           {"amount", to_attribute(deposit->amount)},
           {"shares", to_attribute(shares)}});
    }
  } else {
    for (auto* deposit : deposits) {
      if (!relay_.pull(config.asset_id, escrow_custody, deposit->depositor,
                       deposit->amount)) {
        return failure{.code = transaction_error_code::asset_transfer_failed,
                       .reason = "escrow custody cannot return the deposit"};
      }
      deposit->status = deposit_status_t::refunded;
      release_from_ledger(*deposit);
      tranche::execution::emit(
          context.events, "deposit_refunded",
          {{"deposit_id", to_attribute(deposit->deposit_id)},
           {"vault_id", to_attribute(state_.vault_id)},
           {"depositor", to_attribute(deposit->depositor)},
           {"amount", to_attribute(deposit->amount)}});
    }
  }

  ++state_.round;

  if (batch) {
    auto type = kind == resolution::accept ? std::string_view{"deposits_batch_accepted"}
                                           : std::string_view{"deposits_batch_refunded"};
    tranche::execution::emit(
        context.events, type,
        {{"vault_id", to_attribute(state_.vault_id)},
         {"count", to_attribute(static_cast<uint64_t>(deposits.size()))},
         {"total_assets", to_attribute(total_assets)},
         {"total_shares", to_attribute(minted)},
         {"round", to_attribute(state_.round)}});
  }
  spdlog::debug("escrow {} resolved {} deposits in round {}",
                tranche::schema::to_hex(state_.vault_id), deposits.size(),
                state_.round);
  return {};
}

outcome<std::vector<pending_deposit_t*>> deposit_escrow::collect_pending(
    const std::vector<hash32_t>& deposit_ids) {
  auto deposits = std::vector<pending_deposit_t*>{};
  deposits.reserve(deposit_ids.size());
  for (const auto& deposit_id : deposit_ids) {
    auto* deposit = find_mutable(deposit_id);
    if (deposit == nullptr) {
      return failure{.code = transaction_error_code::deposit_not_found,
                     .reason = "deposit " +
                               tranche::schema::to_hex(deposit_id) +
                               " not found"};
    }
    // A repeated id would resolve the same deposit twice.
    auto repeated = std::find(std::begin(deposits), std::end(deposits),
                              deposit) != std::end(deposits);
    if (deposit->status != deposit_status_t::pending || repeated) {
      return failure{.code = transaction_error_code::deposit_not_pending,
                     .reason = "deposit " +
                               tranche::schema::to_hex(deposit_id) +
                               " is not pending"};
    }
    deposits.push_back(deposit);
  }
  return deposits;
}

pending_deposit_t* deposit_escrow::find_mutable(const hash32_t& deposit_id) {
  auto it = std::find_if(
      std::begin(state_.deposits), std::end(state_.deposits),
      [&](const pending_deposit_t& row) { return row.deposit_id == deposit_id; });
  return it == std::end(state_.deposits) ? nullptr : &*it;
}

uint64_t deposit_escrow::next_depositor_sequence(
    const account_id_t& depositor) {
  auto it = std::lower_bound(
      std::begin(state_.depositor_sequences),
      std::end(state_.depositor_sequences), depositor,
      [](const tranche::schema::depositor_sequence_t& row,
         const account_id_t& key) { return row.depositor < key; });
  if (it == std::end(state_.depositor_sequences) || it->depositor != depositor) {
    state_.depositor_sequences.insert(
        it, tranche::schema::depositor_sequence_t{.depositor = depositor,
                                                  .next = 1});
    return 0;
  }
  return it->next++;
}

void deposit_escrow::release_from_ledger(const pending_deposit_t& deposit) {
  if (state_.total_pending < deposit.amount ||
      !tranche::vault::subtract_amount(state_.user_pending, deposit.depositor,
                                       deposit.amount)) {
    tranche::common::critical("escrow ledger out of balance");
  }
  state_.total_pending -= deposit.amount;
}

}  // namespace tranche::escrow
