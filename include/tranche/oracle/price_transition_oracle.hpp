#pragma once

#include <tranche/common/outcome.hpp>
#include <tranche/execution/context.hpp>
#include <tranche/schema/oracle_state.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/vault/valuation_source.hpp>

#include <cstdint>
#include <string_view>

namespace tranche::oracle {

/// Interpolated price of `state` at `now`.
///
/// Outside a transition this is the target price. Inside one, the price
/// moves linearly from the start price toward the target at
/// `max_deviation_bps` of the start price per period, and lands exactly on
/// the target once the needed movement is covered. It never overshoots.
tranche::schema::amount_t price_at(const tranche::schema::oracle_state_t& state,
                                   tranche::schema::timestamp_seconds_t now);

/// Progress of the running transition in basis points of its full distance.
/// 10000 when no transition is in progress.
uint64_t transition_progress_bps(const tranche::schema::oracle_state_t& state,
                                 tranche::schema::timestamp_seconds_t now);

/// Rate-limited valuation feed.
///
/// Updates within the per-period deviation budget apply at once and consume
/// budget. Larger updates start a gradual transition from the current
/// interpolated price instead, without consuming budget, so a burst of small
/// updates cannot move the price faster than the policy allows.
class price_transition_oracle final : public tranche::vault::valuation_source {
 public:
  explicit price_transition_oracle(tranche::schema::oracle_state_t& state);

  /// Initial state of a new oracle. The creator becomes owner and first
  /// updater.
  static tranche::common::outcome<tranche::schema::oracle_state_t> create(
      const tranche::execution::context_t& context,
      const tranche::schema::hash32_t& oracle_id,
      const tranche::schema::amount_t& initial_price,
      uint64_t max_deviation_bps,
      tranche::schema::duration_seconds_t period_seconds);

  /// Updater only.
  tranche::common::outcome<> update(const tranche::execution::context_t& context,
                                    const tranche::schema::amount_t& new_price,
                                    std::string_view source);

  /// Owner only. Freezes a running transition at its current price before
  /// the policy changes and resets the period budget.
  tranche::common::outcome<> set_max_deviation(
      const tranche::execution::context_t& context,
      uint64_t max_deviation_bps,
      tranche::schema::duration_seconds_t period_seconds);

  /// Owner only. Jumps straight to the target price.
  tranche::common::outcome<> force_complete_transition(
      const tranche::execution::context_t& context);

  /// Owner only.
  tranche::common::outcome<> set_updater(
      const tranche::execution::context_t& context,
      const tranche::schema::account_id_t& account,
      bool enabled);

  tranche::schema::amount_t current_price(
      tranche::schema::timestamp_seconds_t now) const;
  uint64_t transition_progress(tranche::schema::timestamp_seconds_t now) const;
  bool is_updater(const tranche::schema::account_id_t& account) const;
  const tranche::schema::oracle_state_t& state() const;

  tranche::schema::bytes_t report(
      tranche::schema::timestamp_seconds_t now) const override;

 private:
  tranche::common::outcome<> require_owner(
      const tranche::execution::context_t& context) const;

  tranche::schema::oracle_state_t& state_;
};

}  // namespace tranche::oracle
