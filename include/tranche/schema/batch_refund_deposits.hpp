#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <vector>

namespace tranche::schema {

template <uint16_t Version>
struct batch_refund_deposits;

template <>
struct batch_refund_deposits<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  std::vector<hash32_t> deposit_ids;
};

using batch_refund_deposits_t = batch_refund_deposits<1>;

}  // namespace tranche::schema
