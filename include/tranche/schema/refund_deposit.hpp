#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct refund_deposit;

template <>
struct refund_deposit<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  hash32_t deposit_id{};
};

using refund_deposit_t = refund_deposit<1>;

}  // namespace tranche::schema
