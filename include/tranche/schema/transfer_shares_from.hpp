#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct transfer_shares_from;

template <>
struct transfer_shares_from<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  account_id_t from{};
  account_id_t to{};
  amount_t shares{};
};

using transfer_shares_from_t = transfer_shares_from<1>;

}  // namespace tranche::schema
