#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Parallel arrays; a zero `min_assets` entry means no floor.
namespace tranche::schema {

template <uint16_t Version>
struct batch_redeem;

template <>
struct batch_redeem<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  std::vector<amount_t> shares;
  std::vector<account_id_t> receivers;
  std::vector<account_id_t> owners;
  std::vector<amount_t> min_assets;
};

using batch_redeem_t = batch_redeem<1>;

}  // namespace tranche::schema
