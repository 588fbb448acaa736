#pragma once

#include <tranche/common/outcome.hpp>
#include <tranche/hooks/operation_hook.hpp>
#include <tranche/schema/hook_record.hpp>

#include <map>
#include <memory>

namespace tranche::hooks {

/// Hook objects materialised from persisted records.
///
/// The hooks reference the records in place, so the record map must outlive
/// the set and must not be mutated while it is alive.
class hook_set final : public hook_resolver {
 public:
  explicit hook_set(
      const std::map<tranche::schema::hash32_t, tranche::schema::hook_record_t>&
          records);

  hook_set(const hook_set&) = delete;
  hook_set& operator=(const hook_set&) = delete;

  const operation_hook* find(
      const tranche::schema::hash32_t& hook_id) const override;

 private:
  std::map<tranche::schema::hash32_t, std::unique_ptr<operation_hook>> hooks_;
};

/// Validate a new hook registration against the existing records. Rejects a
/// null or taken id, a zero capacity, and composite children that are not
/// yet registered (which keeps the hook graph acyclic).
tranche::common::outcome<> validate_registration(
    const std::map<tranche::schema::hash32_t, tranche::schema::hook_record_t>&
        records,
    const tranche::schema::hook_record_t& candidate);

}  // namespace tranche::hooks
