#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/role_id.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct upsert_role_assignment;

template <>
struct upsert_role_assignment<1> final {
  uint16_t version{1};
  account_id_t subject{};
  role_id_t role{role_id_t::vault_operator};
  bool enabled{true};
};

using upsert_role_assignment_t = upsert_role_assignment<1>;

}  // namespace tranche::schema
