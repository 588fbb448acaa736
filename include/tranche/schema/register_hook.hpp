#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/hook_record.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct register_hook;

template <>
struct register_hook<1> final {
  uint16_t version{1};
  hash32_t hook_id{};
  hook_config_t config{};
};

using register_hook_t = register_hook<1>;

}  // namespace tranche::schema
