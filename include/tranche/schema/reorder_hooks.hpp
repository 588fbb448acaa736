#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/operation_tag.hpp>

#include <cstdint>
#include <vector>

// `new_order[i]` is the old index now placed at position i.
namespace tranche::schema {

template <uint16_t Version>
struct reorder_hooks;

template <>
struct reorder_hooks<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  operation_tag_t tag{operation_tag_t::deposit};
  std::vector<uint32_t> new_order;
};

using reorder_hooks_t = reorder_hooks<1>;

}  // namespace tranche::schema
