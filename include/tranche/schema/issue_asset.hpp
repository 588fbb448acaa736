#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

// Credits underlying asset units to an account (bridged-in funds).
namespace tranche::schema {

template <uint16_t Version>
struct issue_asset;

template <>
struct issue_asset<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  account_id_t to{};
  amount_t amount{};
};

using issue_asset_t = issue_asset<1>;

}  // namespace tranche::schema
