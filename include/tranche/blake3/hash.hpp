#pragma once
#include <tranche/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace tranche::blake3 {

tranche::schema::hash32_t hash(const std::string_view& str);
tranche::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash the concatenation of `parts` without materialising it.
tranche::schema::hash32_t hash(
    std::initializer_list<std::span<const uint8_t>> parts);

}  // namespace tranche::blake3
