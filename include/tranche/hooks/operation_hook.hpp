#pragma once

#include <tranche/schema/operation_tag.hpp>
#include <tranche/schema/primitives.hpp>

#include <span>
#include <string>

namespace tranche::hooks {

/// What a hook sees of the operation it gates.
///
/// Deposits: `from` is the actor supplying assets, `to` the share receiver.
/// Withdrawals: `from` is the share owner, `to` the asset receiver.
/// Transfers: the share sender and recipient; either side is the null
/// account on mint and burn paths, so transfer hooks must tolerate it.
struct hook_context final {
  tranche::schema::operation_tag_t tag{tranche::schema::operation_tag_t::deposit};
  tranche::schema::hash32_t vault_id{};
  tranche::schema::account_id_t actor{};
  tranche::schema::account_id_t from{};
  tranche::schema::account_id_t to{};
  tranche::schema::amount_t assets{};
  tranche::schema::amount_t shares{};
  tranche::schema::amount_t total_assets{};
  tranche::schema::timestamp_seconds_t now{};
};

struct hook_result final {
  bool approved{true};
  std::string reason;

  static hook_result approve() { return hook_result{}; }
  static hook_result reject(std::string reason) {
    return hook_result{.approved = false, .reason = std::move(reason)};
  }
};

/// Validator capsule consulted before a balance-changing operation.
class operation_hook {
 public:
  virtual ~operation_hook() = default;

  virtual hook_result on_before_deposit(const hook_context& context) const = 0;
  virtual hook_result on_before_withdraw(const hook_context& context) const = 0;
  virtual hook_result on_before_transfer(const hook_context& context) const = 0;
};

/// Looks hooks up by id. Returns null for unknown ids.
class hook_resolver {
 public:
  virtual ~hook_resolver() = default;

  virtual const operation_hook* find(
      const tranche::schema::hash32_t& hook_id) const = 0;
};

/// Call the callback matching `context.tag`.
hook_result dispatch(const operation_hook& hook, const hook_context& context);

/// Evaluate `hook_ids` strictly in order. The first rejection short-circuits
/// and its reason is returned verbatim; later hooks do not run. An id the
/// resolver does not know rejects.
hook_result evaluate_in_order(std::span<const tranche::schema::hash32_t> hook_ids,
                              const hook_context& context,
                              const hook_resolver& resolver);

}  // namespace tranche::hooks
