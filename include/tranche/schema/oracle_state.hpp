#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: oracle state.
// `transition_start_price == target_price` exactly when no transition is in
// progress. Prices carry 18 decimals.
namespace tranche::schema {

template <uint16_t Version>
struct oracle_state;

template <>
struct oracle_state<1> final {
  uint16_t version{1};
  hash32_t oracle_id{};
  account_id_t owner{};
  std::vector<account_id_t> updaters;
  amount_t target_price{};
  amount_t transition_start_price{};
  timestamp_seconds_t last_update_at{};
  uint64_t max_deviation_bps{};
  duration_seconds_t period_seconds{};
  uint64_t applied_change_bps{};
  uint64_t round{};
};

using oracle_state_t = oracle_state<1>;

}  // namespace tranche::schema
