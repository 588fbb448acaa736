#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <utility>

namespace tranche::schema {

/// Display names of an enum, as written into event attributes and logs.
template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::string_view enum_name(const Enum value,
                                     const enum_names_t<Enum, N>& names) {
  auto it = std::find_if(std::begin(names), std::end(names),
                         [&](const auto& entry) { return entry.second == value; });
  return it == std::end(names) ? std::string_view{"unknown"} : it->first;
}

}  // namespace tranche::schema
