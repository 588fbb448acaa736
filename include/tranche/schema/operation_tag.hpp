#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: operation tag.
// Balance-changing operation family a hook list and its watermark are keyed
// by.
namespace tranche::schema {

enum class operation_tag_t : uint8_t { deposit = 0, withdraw = 1, transfer = 2 };

inline constexpr auto kOperationTagNames = enum_names_t<operation_tag_t, 3>{
    std::pair<std::string_view, operation_tag_t>{"deposit",
                                                 operation_tag_t::deposit},
    std::pair<std::string_view, operation_tag_t>{"withdraw",
                                                 operation_tag_t::withdraw},
    std::pair<std::string_view, operation_tag_t>{"transfer",
                                                 operation_tag_t::transfer},
};

inline constexpr std::string_view to_string(const operation_tag_t value) {
  return enum_name(value, kOperationTagNames);
}

}  // namespace tranche::schema
