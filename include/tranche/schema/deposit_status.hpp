#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: deposit status.
// Pending deposits leave `pending` exactly once; both terminal states are
// immutable.
namespace tranche::schema {

enum class deposit_status_t : uint8_t { pending = 0, accepted = 1, refunded = 2 };

inline constexpr auto kDepositStatusNames = enum_names_t<deposit_status_t, 3>{
    std::pair<std::string_view, deposit_status_t>{"pending",
                                                  deposit_status_t::pending},
    std::pair<std::string_view, deposit_status_t>{"accepted",
                                                  deposit_status_t::accepted},
    std::pair<std::string_view, deposit_status_t>{"refunded",
                                                  deposit_status_t::refunded},
};

inline constexpr std::string_view to_string(const deposit_status_t value) {
  return enum_name(value, kDepositStatusNames);
}

}  // namespace tranche::schema
