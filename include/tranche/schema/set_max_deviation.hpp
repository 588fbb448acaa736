#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct set_max_deviation;

template <>
struct set_max_deviation<1> final {
  uint16_t version{1};
  hash32_t oracle_id{};
  uint64_t max_deviation_bps{};
  duration_seconds_t period_seconds{};
};

using set_max_deviation_t = set_max_deviation<1>;

}  // namespace tranche::schema
