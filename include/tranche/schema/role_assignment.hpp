#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/role_id.hpp>

#include <cstdint>

// Schema type: role assignment.
namespace tranche::schema {

template <uint16_t Version>
struct role_assignment;

template <>
struct role_assignment<1> final {
  uint16_t version{1};
  account_id_t subject{};
  role_id_t role{role_id_t::admin};
};

using role_assignment_t = role_assignment<1>;

}  // namespace tranche::schema
