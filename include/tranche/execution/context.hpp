#pragma once

#include <tranche/execution/authorization.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction_event.hpp>

#include <cstdint>
#include <vector>

namespace tranche::execution {

/// Per-transaction call context handed to every core operation.
///
/// `sequence` is the global operation sequence of the running transaction;
/// hook registration stamps and watermarks are expressed in it. Events
/// appended here surface in the transaction result only when the transaction
/// succeeds.
struct context_t final {
  tranche::schema::account_id_t actor{};
  tranche::schema::timestamp_seconds_t now{};
  uint64_t sequence{};
  const authorization& authz;
  std::vector<tranche::schema::transaction_event_t>& events;
};

}  // namespace tranche::execution
