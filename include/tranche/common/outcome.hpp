#pragma once

#include <tranche/schema/transaction_error_code.hpp>

#include <string>
#include <utility>
#include <variant>

namespace tranche::common {

/// Rejection reported by a core operation. Carries the stable error code and
/// the human readable reason surfaced to the caller (for hook rejections, the
/// hook's own reason verbatim).
struct failure final {
  tranche::schema::transaction_error_code code{
      tranche::schema::transaction_error_code::invalid_transaction};
  std::string reason;
};

/// Value-or-failure result of a core operation.
///
/// Operations check what they can before they mutate, but a failure part way
/// through can leave earlier changes in the callee's state: batch operations
/// stop at the first failing entry and keep the entries before it. A
/// transaction is all-or-nothing because the engine runs it against a working
/// copy of the state and drops that copy on any failure.
template <typename T = std::monostate>
struct outcome final {
  tranche::schema::transaction_error_code code{
      tranche::schema::transaction_error_code::ok};
  std::string reason;
  T value{};

  outcome() = default;
  outcome(T result) : value{std::move(result)} {}
  outcome(failure rejected)
      : code{rejected.code}, reason{std::move(rejected.reason)} {}

  bool ok() const { return code == tranche::schema::transaction_error_code::ok; }

  failure error() const { return failure{.code = code, .reason = reason}; }
};

}  // namespace tranche::common
