#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace tranche::schema {

template <uint16_t Version>
struct update_price;

template <>
struct update_price<1> final {
  uint16_t version{1};
  hash32_t oracle_id{};
  amount_t price{};
  std::string source;
};

using update_price_t = update_price<1>;

}  // namespace tranche::schema
