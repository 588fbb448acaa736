#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: hook entry.
// One position in a per-tag hook list. `registered_at` is the operation
// sequence of the transaction that added it; removal compares it against the
// tag's watermark.
namespace tranche::schema {

template <uint16_t Version>
struct hook_entry;

template <>
struct hook_entry<1> final {
  uint16_t version{1};
  hash32_t hook_id{};
  uint64_t registered_at{};
};

using hook_entry_t = hook_entry<1>;

template <uint16_t Version>
struct hook_pipeline_state;

template <>
struct hook_pipeline_state<1> final {
  uint16_t version{1};
  std::vector<hook_entry_t> deposit_hooks;
  std::vector<hook_entry_t> withdraw_hooks;
  std::vector<hook_entry_t> transfer_hooks;
  uint64_t deposit_watermark{};
  uint64_t withdraw_watermark{};
  uint64_t transfer_watermark{};
};

using hook_pipeline_state_t = hook_pipeline_state<1>;

}  // namespace tranche::schema
