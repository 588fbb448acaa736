#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/withdrawal_request.hpp>

#include <cstdint>
#include <vector>

namespace tranche::schema {

template <uint16_t Version>
struct execute_signed_withdrawals;

template <>
struct execute_signed_withdrawals<1> final {
  uint16_t version{1};
  hash32_t vault_id{};
  std::vector<signed_withdrawal_t> withdrawals;
};

using execute_signed_withdrawals_t = execute_signed_withdrawals<1>;

}  // namespace tranche::schema
