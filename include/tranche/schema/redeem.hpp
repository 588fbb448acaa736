#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace tranche::schema {

template <uint16_t Version>
struct redeem;

template <>
struct redeem<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  amount_t shares{};
  account_id_t receiver{};
  account_id_t owner{};
  std::optional<amount_t> min_assets;
};

using redeem_t = redeem<1>;

}  // namespace tranche::schema
