#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

// Schema type: asset balance.
// Underlying-asset holdings tracked by the asset ledger, including vault and
// escrow custody accounts.
namespace tranche::schema {

template <uint16_t Version>
struct asset_balance;

template <>
struct asset_balance<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  account_id_t account{};
  amount_t amount{};
};

using asset_balance_t = asset_balance<1>;

}  // namespace tranche::schema
