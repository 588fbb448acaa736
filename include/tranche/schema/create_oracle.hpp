#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct create_oracle;

template <>
struct create_oracle<1> final {
  uint16_t version{1};
  hash32_t oracle_id{};
  amount_t initial_price{};
  uint64_t max_deviation_bps{};
  duration_seconds_t period_seconds{};
};

using create_oracle_t = create_oracle<1>;

}  // namespace tranche::schema
