#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct force_complete_transition;

template <>
struct force_complete_transition<1> final {
  uint16_t version{1};
  hash32_t oracle_id{};
};

using force_complete_transition_t = force_complete_transition<1>;

}  // namespace tranche::schema
