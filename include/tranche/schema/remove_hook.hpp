#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/operation_tag.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct remove_hook;

template <>
struct remove_hook<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  operation_tag_t tag{operation_tag_t::deposit};
  uint32_t index{};
};

using remove_hook_t = remove_hook<1>;

}  // namespace tranche::schema
