#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

// On a gated vault this creates a pending escrow deposit instead.
namespace tranche::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  amount_t assets{};
  account_id_t receiver{};
};

using deposit_t = deposit<1>;

}  // namespace tranche::schema
