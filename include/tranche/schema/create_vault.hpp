#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace tranche::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  asset_id_t asset_id{};
  bool gated_deposits{};
  bool managed_withdrawals{};
  std::optional<hash32_t> oracle_id;
  duration_seconds_t deposit_expiration_seconds{};
};

using create_vault_t = create_vault<1>;

}  // namespace tranche::schema
