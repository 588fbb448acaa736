#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

// Schema type: share allowance.
namespace tranche::schema {

template <uint16_t Version>
struct share_allowance;

template <>
struct share_allowance<1> final {
  uint16_t version{1};
  account_id_t owner{};
  account_id_t spender{};
  amount_t shares{};
};

using share_allowance_t = share_allowance<1>;

}  // namespace tranche::schema
