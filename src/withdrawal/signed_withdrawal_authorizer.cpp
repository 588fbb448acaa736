#include <algorithm>
#include <spdlog/spdlog.h>
#include <string>
#include <tranche/blake3/hash.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/withdrawal/signed_withdrawal_authorizer.hpp>
#include <tuple>
#include <utility>

namespace tranche::withdrawal {

namespace {

using tranche::common::failure;
using tranche::common::outcome;
using tranche::execution::to_attribute;
using tranche::schema::account_id_t;
using tranche::schema::amount_t;
using tranche::schema::transaction_error_code;
using tranche::schema::used_withdrawal_nonce_t;

const auto kWithdrawalDomain = std::string{"tranche.withdrawal.v1"};

bool nonce_less(const used_withdrawal_nonce_t& row,
                const std::pair<account_id_t, uint64_t>& key) {
  return std::pair{row.owner, row.nonce} < key;
}

}  // namespace

tranche::schema::hash32_t make_withdrawal_digest(
    const tranche::schema::hash32_t& chain_id,
    const tranche::schema::hash32_t& vault_id,
    const tranche::schema::withdrawal_request_t& request) {
  auto encoder = tranche::schema::encoding::encoder<
      tranche::schema::encoding::scale_encoder_tag>{};
  auto message = encoder.encode(std::tuple{kWithdrawalDomain, chain_id, vault_id});
  encoder.encode(request, message);
  return tranche::blake3::hash(tranche::schema::bytes_view_t{message});
}

signed_withdrawal_authorizer::signed_withdrawal_authorizer(
    tranche::schema::withdrawal_nonce_state_t& nonces,
    tranche::vault::share_vault& vault,
    const tranche::schema::hash32_t& chain_id,
    tranche::execution::signature_verifier_t verifier)
    : nonces_{nonces},
      vault_{vault},
      chain_id_{chain_id},
      verifier_{std::move(verifier)} {}

outcome<amount_t> signed_withdrawal_authorizer::execute(
    const tranche::execution::context_t& context,
    const std::vector<tranche::schema::signed_withdrawal_t>& withdrawals) {
  if (!context.authz.is_authorized(context.actor,
                                   tranche::schema::role_id_t::vault_operator)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "signed withdrawals require the operator"};
  }
  if (!vault_.config().managed_withdrawals) {
    return failure{.code = transaction_error_code::operation_disabled,
                   .reason = "signed withdrawals require a managed vault"};
  }
  if (withdrawals.empty()) {
    return failure{.code = transaction_error_code::invalid_array_lengths,
                   .reason = "no withdrawals given"};
  }

  auto total = amount_t{0};
  for (const auto& withdrawal : withdrawals) {
    auto released = execute_one(context, withdrawal);
    if (!released.ok()) {
      return released;
    }
    total += released.value;
  }
  return total;
}

bool signed_withdrawal_authorizer::is_nonce_used(const account_id_t& owner,
                                                 const uint64_t nonce) const {
  auto key = std::pair{owner, nonce};
  auto it = std::lower_bound(std::begin(nonces_.used), std::end(nonces_.used),
                             key, nonce_less);
  return it != std::end(nonces_.used) && it->owner == owner &&
         it->nonce == nonce;
}

outcome<amount_t> signed_withdrawal_authorizer::execute_one(
    const tranche::execution::context_t& context,
    const tranche::schema::signed_withdrawal_t& withdrawal) {
  const auto& request = withdrawal.request;
  if (request.expiration < context.now) {
    return failure{.code = transaction_error_code::withdrawal_request_expired,
                   .reason = "withdrawal request expired at " +
                             std::to_string(request.expiration)};
  }
  if (is_nonce_used(request.owner, request.nonce)) {
    return failure{.code = transaction_error_code::withdraw_nonce_reuse,
                   .reason = "nonce " + std::to_string(request.nonce) +
                             " already used"};
  }

  auto digest =
      make_withdrawal_digest(chain_id_, vault_.config().vault_id, request);
  auto signer_matches =
      tranche::schema::make_account_id(withdrawal.signer) == request.owner;
  if (!signer_matches ||
      !verifier_(tranche::schema::bytes_view_t{digest}, withdrawal.signer,
                 withdrawal.signature)) {
    return failure{.code = transaction_error_code::withdraw_invalid_signature,
                   .reason = "signature does not authorize the owner"};
  }

  auto floor = request.min_assets == 0
                   ? std::optional<amount_t>{}
                   : std::optional<amount_t>{request.min_assets};
  auto released =
      vault_.redeem(context, request.shares, request.to, request.owner, floor);
  if (!released.ok()) {
    return released;
  }
  mark_nonce_used(request.owner, request.nonce);

  spdlog::debug("signed withdrawal nonce {} released {} assets",
                request.nonce, released.value.str());
  tranche::execution::emit(
      context.events, "signed_withdrawal_executed",
      {{"vault_id", to_attribute(vault_.config().vault_id)},
       {"owner", to_attribute(request.owner)},
       {"to", to_attribute(request.to)},
       {"nonce", to_attribute(request.nonce)},
       {"shares", to_attribute(request.shares)},
       {"assets", to_attribute(released.value)}});
  return released;
}

void signed_withdrawal_authorizer::mark_nonce_used(const account_id_t& owner,
                                                   const uint64_t nonce) {
  auto key = std::pair{owner, nonce};
  auto it = std::lower_bound(std::begin(nonces_.used), std::end(nonces_.used),
                             key, nonce_less);
  nonces_.used.insert(it, used_withdrawal_nonce_t{.owner = owner, .nonce = nonce});
}

}  // namespace tranche::withdrawal
