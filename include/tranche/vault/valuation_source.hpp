#pragma once

#include <tranche/schema/primitives.hpp>

namespace tranche::vault {

/// Price feed behind a vault's total-assets computation.
class valuation_source {
 public:
  virtual ~valuation_source() = default;

  /// 32 byte big-endian unsigned price per whole share, 18 decimals.
  virtual tranche::schema::bytes_t report(
      tranche::schema::timestamp_seconds_t now) const = 0;
};

}  // namespace tranche::vault
