#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <tranche/hooks/hook_pipeline.hpp>

using tranche::schema::operation_tag_t;
using tranche::schema::transaction_error_code;

namespace tranche::hooks {

hook_pipeline::hook_pipeline(tranche::schema::hook_pipeline_state_t& state)
    : state_{state} {}

std::vector<tranche::schema::hook_entry_t>& hook_pipeline::entries(
    const operation_tag_t tag) {
  switch (tag) {
    case operation_tag_t::deposit:
      return state_.deposit_hooks;
    case operation_tag_t::withdraw:
      return state_.withdraw_hooks;
    case operation_tag_t::transfer:
      break;
  }
  return state_.transfer_hooks;
}

const std::vector<tranche::schema::hook_entry_t>& hook_pipeline::list_hooks(
    const operation_tag_t tag) const {
  switch (tag) {
    case operation_tag_t::deposit:
      return state_.deposit_hooks;
    case operation_tag_t::withdraw:
      return state_.withdraw_hooks;
    case operation_tag_t::transfer:
      break;
  }
  return state_.transfer_hooks;
}

uint64_t& hook_pipeline::watermark_ref(const operation_tag_t tag) {
  switch (tag) {
    case operation_tag_t::deposit:
      return state_.deposit_watermark;
    case operation_tag_t::withdraw:
      return state_.withdraw_watermark;
    case operation_tag_t::transfer:
      break;
  }
  return state_.transfer_watermark;
}

uint64_t hook_pipeline::watermark(const operation_tag_t tag) const {
  switch (tag) {
    case operation_tag_t::deposit:
      return state_.deposit_watermark;
    case operation_tag_t::withdraw:
      return state_.withdraw_watermark;
    case operation_tag_t::transfer:
      break;
  }
  return state_.transfer_watermark;
}

tranche::common::outcome<> hook_pipeline::add_hook(
    const operation_tag_t tag,
    const tranche::schema::hash32_t& hook_id,
    const uint64_t sequence) {
  if (tranche::schema::is_null_account(hook_id)) {
    return tranche::common::failure{transaction_error_code::invalid_hook,
                                    "hook reference must not be null"};
  }
  entries(tag).push_back(tranche::schema::hook_entry_t{
      .hook_id = hook_id, .registered_at = sequence});
  return {};
}

tranche::common::outcome<tranche::schema::hook_entry_t>
hook_pipeline::remove_hook(const operation_tag_t tag, const uint32_t index) {
  auto& list = entries(tag);
  if (index >= list.size()) {
    return tranche::common::failure{
        transaction_error_code::invalid_index,
        fmt::format("hook index {} out of bounds ({} {} hooks)", index,
                    list.size(), tranche::schema::to_string(tag))};
  }
  auto removed = list[index];
  if (watermark(tag) >= removed.registered_at) {
    return tranche::common::failure{
        transaction_error_code::hook_removal_blocked,
        fmt::format("{} hook at index {} has gated an executed operation",
                    tranche::schema::to_string(tag), index)};
  }
  list[index] = list.back();
  list.pop_back();
  return removed;
}

tranche::common::outcome<> hook_pipeline::reorder(
    const operation_tag_t tag,
    const std::vector<uint32_t>& new_order) {
  auto& list = entries(tag);
  if (new_order.size() != list.size()) {
    return tranche::common::failure{
        transaction_error_code::invalid_array_lengths,
        fmt::format("reorder expects {} indices, got {}", list.size(),
                    new_order.size())};
  }
  auto seen = std::vector<bool>(list.size(), false);
  for (const auto index : new_order) {
    if (index >= list.size()) {
      return tranche::common::failure{
          transaction_error_code::invalid_index,
          fmt::format("reorder index {} out of bounds", index)};
    }
    if (seen[index]) {
      return tranche::common::failure{
          transaction_error_code::invalid_order,
          fmt::format("reorder index {} repeated", index)};
    }
    seen[index] = true;
  }

  auto reordered = std::vector<tranche::schema::hook_entry_t>{};
  reordered.reserve(list.size());
  std::transform(std::begin(new_order), std::end(new_order),
                 std::back_inserter(reordered),
                 [&](const uint32_t index) { return list[index]; });
  list = std::move(reordered);
  return {};
}

hook_result hook_pipeline::run_all(const hook_context& context,
                                   const hook_resolver& resolver) const {
  const auto& list = list_hooks(context.tag);
  auto ids = std::vector<tranche::schema::hash32_t>{};
  ids.reserve(list.size());
  for (const auto& entry : list) {
    ids.push_back(entry.hook_id);
  }
  return evaluate_in_order(ids, context, resolver);
}

void hook_pipeline::record_execution(const operation_tag_t tag,
                                     const uint64_t sequence) {
  auto& current = watermark_ref(tag);
  current = std::max(current, sequence);
}

}  // namespace tranche::hooks
