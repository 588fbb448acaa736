#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: role id.
// Coarse permission roles: admin (vault/oracle/asset lifecycle, role
// grants), manager (hook lists and hook configuration), operator (escrow
// resolution, managed redemption, signed withdrawals).
namespace tranche::schema {

enum class role_id_t : uint8_t { admin = 0, manager = 1, vault_operator = 2 };

inline constexpr auto kRoleIdNames = enum_names_t<role_id_t, 3>{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"manager", role_id_t::manager},
    std::pair<std::string_view, role_id_t>{"operator",
                                           role_id_t::vault_operator},
};

inline constexpr std::string_view to_string(const role_id_t value) {
  return enum_name(value, kRoleIdNames);
}

}  // namespace tranche::schema
