#pragma once

#include <tranche/schema/account_amount.hpp>
#include <tranche/schema/hook_entry.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/share_allowance.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Schema type: vault state.
// Share ledger of one vault: configuration, supply, balances, allowances and
// the per-tag hook pipeline.
namespace tranche::schema {

template <uint16_t Version>
struct vault_config;

template <>
struct vault_config<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  asset_id_t asset_id{};
  bool gated_deposits{};
  bool managed_withdrawals{};
  std::optional<hash32_t> oracle_id;
  duration_seconds_t deposit_expiration_seconds{};
};

using vault_config_t = vault_config<1>;

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_config_t config{};
  amount_t total_supply{};
  std::vector<account_amount_t> balances;
  std::vector<share_allowance_t> allowances;
  hook_pipeline_state_t hooks{};
};

using vault_state_t = vault_state<1>;

}  // namespace tranche::schema
