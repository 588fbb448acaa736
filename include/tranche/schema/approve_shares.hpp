#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct approve_shares;

template <>
struct approve_shares<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  account_id_t spender{};
  amount_t shares{};
};

using approve_shares_t = approve_shares<1>;

}  // namespace tranche::schema
