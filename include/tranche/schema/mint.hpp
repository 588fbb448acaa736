#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  amount_t shares{};
  account_id_t receiver{};
};

using mint_t = mint<1>;

}  // namespace tranche::schema
