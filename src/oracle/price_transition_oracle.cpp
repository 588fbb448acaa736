#include <algorithm>
#include <spdlog/spdlog.h>
#include <tranche/common/math.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/oracle/price_transition_oracle.hpp>

namespace tranche::oracle {

namespace {

using tranche::common::failure;
using tranche::common::kBasisPoints;
using tranche::common::outcome;
using tranche::execution::to_attribute;
using tranche::schema::amount_t;
using tranche::schema::transaction_error_code;

struct transition_progress_t final {
  amount_t needed_bps;
  amount_t progress_bps;
};

transition_progress_t progress_of(const tranche::schema::oracle_state_t& state,
                                  const tranche::schema::timestamp_seconds_t now) {
  auto distance = tranche::common::absolute_difference(
      state.target_price, state.transition_start_price);
  auto needed = distance * kBasisPoints / state.transition_start_price;
  auto elapsed = now > state.last_update_at ? now - state.last_update_at : 0;
  auto elapsed_bps = amount_t{elapsed} * state.max_deviation_bps /
                     state.period_seconds;
  return transition_progress_t{.needed_bps = needed,
                               .progress_bps = std::min(elapsed_bps, needed)};
}

outcome<> validate_policy(const uint64_t max_deviation_bps,
                          const tranche::schema::duration_seconds_t period_seconds) {
  if (max_deviation_bps == 0 || period_seconds == 0) {
    return failure{.code = transaction_error_code::invalid_oracle_policy,
                   .reason = "deviation and period must be greater than zero"};
  }
  return {};
}

}  // namespace

amount_t price_at(const tranche::schema::oracle_state_t& state,
                  const tranche::schema::timestamp_seconds_t now) {
  if (state.transition_start_price == state.target_price) {
    return state.target_price;
  }
  auto progress = progress_of(state, now);
  if (progress.progress_bps >= progress.needed_bps) {
    return state.target_price;
  }
  auto step = state.transition_start_price * progress.progress_bps / kBasisPoints;
  if (state.target_price > state.transition_start_price) {
    return state.transition_start_price + step;
  }
  return state.transition_start_price - step;
}

uint64_t transition_progress_bps(const tranche::schema::oracle_state_t& state,
                                 const tranche::schema::timestamp_seconds_t now) {
  if (state.transition_start_price == state.target_price) {
    return kBasisPoints;
  }
  auto progress = progress_of(state, now);
  if (progress.needed_bps == 0) {
    return kBasisPoints;
  }
  return static_cast<uint64_t>(progress.progress_bps * kBasisPoints /
                               progress.needed_bps);
}

price_transition_oracle::price_transition_oracle(
    tranche::schema::oracle_state_t& state)
    : state_{state} {}

outcome<tranche::schema::oracle_state_t> price_transition_oracle::create(
    const tranche::execution::context_t& context,
    const tranche::schema::hash32_t& oracle_id,
    const amount_t& initial_price,
    const uint64_t max_deviation_bps,
    const tranche::schema::duration_seconds_t period_seconds) {
  if (tranche::schema::is_null_account(oracle_id)) {
    return failure{.code = transaction_error_code::invalid_identifier,
                   .reason = "oracle id must not be null"};
  }
  if (initial_price == 0) {
    return failure{.code = transaction_error_code::invalid_price,
                   .reason = "initial price must be greater than zero"};
  }
  if (auto policy = validate_policy(max_deviation_bps, period_seconds);
      !policy.ok()) {
    return policy.error();
  }

  auto state = tranche::schema::oracle_state_t{};
  state.oracle_id = oracle_id;
  state.owner = context.actor;
  state.updaters = {context.actor};
  state.target_price = initial_price;
  state.transition_start_price = initial_price;
  state.last_update_at = context.now;
  state.max_deviation_bps = max_deviation_bps;
  state.period_seconds = period_seconds;
  return state;
}

outcome<> price_transition_oracle::update(
    const tranche::execution::context_t& context,
    const amount_t& new_price,
    const std::string_view source) {
  if (!is_updater(context.actor)) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "caller is not an oracle updater"};
  }
  if (source.empty()) {
    return failure{.code = transaction_error_code::empty_source,
                   .reason = "price source must not be empty"};
  }
  if (new_price == 0) {
    return failure{.code = transaction_error_code::invalid_price,
                   .reason = "price must be greater than zero"};
  }

  auto current = price_at(state_, context.now);
  if (context.now >= state_.last_update_at &&
      context.now - state_.last_update_at >= state_.period_seconds) {
    state_.applied_change_bps = 0;
  }

  auto delta_bps = tranche::common::absolute_difference(new_price, current) *
                   kBasisPoints / current;
  auto budget = amount_t{state_.applied_change_bps} + delta_bps;
  auto immediate = budget <= state_.max_deviation_bps;
  if (immediate) {
    state_.transition_start_price = new_price;
    state_.target_price = new_price;
    state_.applied_change_bps = static_cast<uint64_t>(budget);
  } else {
    state_.transition_start_price = current;
    state_.target_price = new_price;
  }
  state_.last_update_at = context.now;
  ++state_.round;

  spdlog::debug("oracle {} round {} {} update toward {}",
                tranche::schema::to_hex(state_.oracle_id), state_.round,
                immediate ? "immediate" : "gradual", new_price.str());
  tranche::execution::emit(
      context.events, "oracle_price_updated",
      {{"oracle_id", to_attribute(state_.oracle_id)},
       {"round", to_attribute(state_.round)},
       {"target_price", to_attribute(state_.target_price)},
       {"start_price", to_attribute(state_.transition_start_price)},
       {"source", std::string{source}}});
  return {};
}

outcome<> price_transition_oracle::set_max_deviation(
    const tranche::execution::context_t& context,
    const uint64_t max_deviation_bps,
    const tranche::schema::duration_seconds_t period_seconds) {
  if (auto allowed = require_owner(context); !allowed.ok()) {
    return allowed;
  }
  if (auto policy = validate_policy(max_deviation_bps, period_seconds);
      !policy.ok()) {
    return policy;
  }

  if (state_.transition_start_price != state_.target_price) {
    state_.transition_start_price = price_at(state_, context.now);
  }
  auto old_deviation = state_.max_deviation_bps;
  auto old_period = state_.period_seconds;
  state_.applied_change_bps = 0;
  state_.last_update_at = context.now;
  state_.max_deviation_bps = max_deviation_bps;
  state_.period_seconds = period_seconds;

  tranche::execution::emit(
      context.events, "oracle_policy_changed",
      {{"oracle_id", to_attribute(state_.oracle_id)},
       {"old_max_deviation_bps", to_attribute(old_deviation)},
       {"new_max_deviation_bps", to_attribute(max_deviation_bps)},
       {"old_period_seconds", to_attribute(old_period)},
       {"new_period_seconds", to_attribute(period_seconds)}});
  return {};
}

outcome<> price_transition_oracle::force_complete_transition(
    const tranche::execution::context_t& context) {
  if (auto allowed = require_owner(context); !allowed.ok()) {
    return allowed;
  }
  state_.transition_start_price = state_.target_price;
  state_.last_update_at = context.now;

  tranche::execution::emit(context.events, "oracle_transition_forced",
                           {{"oracle_id", to_attribute(state_.oracle_id)},
                            {"price", to_attribute(state_.target_price)}});
  return {};
}

outcome<> price_transition_oracle::set_updater(
    const tranche::execution::context_t& context,
    const tranche::schema::account_id_t& account,
    const bool enabled) {
  if (auto allowed = require_owner(context); !allowed.ok()) {
    return allowed;
  }
  if (tranche::schema::is_null_account(account)) {
    return failure{.code = transaction_error_code::invalid_account,
                   .reason = "updater must not be the null account"};
  }

  auto& updaters = state_.updaters;
  auto it = std::lower_bound(std::begin(updaters), std::end(updaters), account);
  auto present = it != std::end(updaters) && *it == account;
  if (enabled && !present) {
    updaters.insert(it, account);
  } else if (!enabled && present) {
    updaters.erase(it);
  }

  tranche::execution::emit(context.events, "oracle_updater_changed",
                           {{"oracle_id", to_attribute(state_.oracle_id)},
                            {"account", to_attribute(account)},
                            {"enabled", enabled ? "true" : "false"}});
  return {};
}

amount_t price_transition_oracle::current_price(
    const tranche::schema::timestamp_seconds_t now) const {
  return price_at(state_, now);
}

uint64_t price_transition_oracle::transition_progress(
    const tranche::schema::timestamp_seconds_t now) const {
  return transition_progress_bps(state_, now);
}

bool price_transition_oracle::is_updater(
    const tranche::schema::account_id_t& account) const {
  return std::binary_search(std::begin(state_.updaters),
                            std::end(state_.updaters), account);
}

const tranche::schema::oracle_state_t& price_transition_oracle::state() const {
  return state_;
}

tranche::schema::bytes_t price_transition_oracle::report(
    const tranche::schema::timestamp_seconds_t now) const {
  return tranche::schema::encode_uint256(price_at(state_, now));
}

outcome<> price_transition_oracle::require_owner(
    const tranche::execution::context_t& context) const {
  if (context.actor != state_.owner) {
    return failure{.code = transaction_error_code::unauthorized,
                   .reason = "caller is not the oracle owner"};
  }
  return {};
}

}  // namespace tranche::oracle
