#pragma once

#include <tranche/common/outcome.hpp>
#include <tranche/hooks/operation_hook.hpp>
#include <tranche/schema/hook_entry.hpp>
#include <tranche/schema/operation_tag.hpp>

#include <cstdint>
#include <vector>

namespace tranche::hooks {

/// Ordered per-tag hook lists with removal frozen by execution watermarks.
///
/// Works in place on a vault's persisted `hook_pipeline_state_t`. Every
/// mutation is a pure data-structure operation; authorization is the
/// caller's job.
class hook_pipeline final {
 public:
  explicit hook_pipeline(tranche::schema::hook_pipeline_state_t& state);

  /// Append `{hook_id, sequence}`. Rejects the null id. Duplicates are kept.
  tranche::common::outcome<> add_hook(tranche::schema::operation_tag_t tag,
                                      const tranche::schema::hash32_t& hook_id,
                                      uint64_t sequence);

  /// Swap-with-last removal. Rejected when the index is out of range or when
  /// an operation of `tag` has completed since the hook was registered.
  tranche::common::outcome<tranche::schema::hook_entry_t> remove_hook(
      tranche::schema::operation_tag_t tag,
      uint32_t index);

  /// `new_order[i]` names the old index placed at position i. Must be a
  /// permutation of the current indices.
  tranche::common::outcome<> reorder(tranche::schema::operation_tag_t tag,
                                     const std::vector<uint32_t>& new_order);

  const std::vector<tranche::schema::hook_entry_t>& list_hooks(
      tranche::schema::operation_tag_t tag) const;

  /// Run the hooks registered for `context.tag`.
  hook_result run_all(const hook_context& context,
                      const hook_resolver& resolver) const;

  /// Advance the watermark of `tag` after an operation completed.
  void record_execution(tranche::schema::operation_tag_t tag,
                        uint64_t sequence);

  uint64_t watermark(tranche::schema::operation_tag_t tag) const;

 private:
  std::vector<tranche::schema::hook_entry_t>& entries(
      tranche::schema::operation_tag_t tag);
  uint64_t& watermark_ref(tranche::schema::operation_tag_t tag);

  tranche::schema::hook_pipeline_state_t& state_;
};

}  // namespace tranche::hooks
