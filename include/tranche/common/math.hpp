#pragma once

#include <tranche/schema/primitives.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace tranche::common {

enum class rounding : uint8_t { down = 0, up = 1 };

inline constexpr uint64_t kBasisPoints = 10'000;

/// floor or ceil of (a * b) / denominator with a 512-bit intermediate, so the
/// product of two 256-bit amounts cannot overflow. `denominator` must be
/// non-zero; callers guard it.
inline tranche::schema::amount_t mul_div(const tranche::schema::amount_t& a,
                                         const tranche::schema::amount_t& b,
                                         const tranche::schema::amount_t& denominator,
                                         const rounding mode) {
  using wide_t = boost::multiprecision::uint512_t;
  auto product = static_cast<wide_t>(a) * static_cast<wide_t>(b);
  auto quotient = product / static_cast<wide_t>(denominator);
  if (mode == rounding::up &&
      (product % static_cast<wide_t>(denominator)) != 0) {
    ++quotient;
  }
  return static_cast<tranche::schema::amount_t>(quotient);
}

inline tranche::schema::amount_t absolute_difference(
    const tranche::schema::amount_t& a,
    const tranche::schema::amount_t& b) {
  return a > b ? a - b : b - a;
}

}  // namespace tranche::common
