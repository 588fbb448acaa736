#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct update_allow_list;

template <>
struct update_allow_list<1> final {
  uint16_t version{1};
  hash32_t hook_id{};
  account_id_t account{};
  bool listed{true};
};

using update_allow_list_t = update_allow_list<1>;

}  // namespace tranche::schema
