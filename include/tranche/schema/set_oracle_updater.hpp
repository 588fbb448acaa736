#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct set_oracle_updater;

template <>
struct set_oracle_updater<1> final {
  uint16_t version{1};
  hash32_t oracle_id{};
  account_id_t account{};
  bool enabled{true};
};

using set_oracle_updater_t = set_oracle_updater<1>;

}  // namespace tranche::schema
