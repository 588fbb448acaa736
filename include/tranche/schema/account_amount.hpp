#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>

// Schema type: account amount.
// Sorted (account, amount) rows used for share balances and per-depositor
// pending totals. Zero rows are never stored.
namespace tranche::schema {

template <uint16_t Version>
struct account_amount;

template <>
struct account_amount<1> final {
  uint16_t version{1};
  account_id_t account{};
  amount_t amount{};
};

using account_amount_t = account_amount<1>;

}  // namespace tranche::schema
