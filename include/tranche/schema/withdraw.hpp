#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  amount_t assets{};
  account_id_t receiver{};
  account_id_t owner{};
};

using withdraw_t = withdraw<1>;

}  // namespace tranche::schema
