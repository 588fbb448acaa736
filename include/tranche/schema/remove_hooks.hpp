#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/operation_tag.hpp>

#include <cstdint>
#include <vector>

// Indices are applied in order against the list as it stands after
// each removal.
namespace tranche::schema {

template <uint16_t Version>
struct remove_hooks;

template <>
struct remove_hooks<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  operation_tag_t tag{operation_tag_t::deposit};
  std::vector<uint32_t> indices;
};

using remove_hooks_t = remove_hooks<1>;

}  // namespace tranche::schema
