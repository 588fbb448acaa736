#include <fmt/format.h>
#include <tranche/hooks/operation_hook.hpp>

namespace tranche::hooks {

hook_result dispatch(const operation_hook& hook, const hook_context& context) {
  switch (context.tag) {
    case tranche::schema::operation_tag_t::deposit:
      return hook.on_before_deposit(context);
    case tranche::schema::operation_tag_t::withdraw:
      return hook.on_before_withdraw(context);
    case tranche::schema::operation_tag_t::transfer:
      return hook.on_before_transfer(context);
  }
  return hook_result::reject("unknown operation tag");
}

hook_result evaluate_in_order(
    std::span<const tranche::schema::hash32_t> hook_ids,
    const hook_context& context,
    const hook_resolver& resolver) {
  for (const auto& hook_id : hook_ids) {
    const auto* hook = resolver.find(hook_id);
    if (hook == nullptr) {
      return hook_result::reject(fmt::format(
          "hook {} is not registered",
          tranche::schema::to_hex(tranche::schema::bytes_view_t{hook_id})));
    }
    auto result = dispatch(*hook, context);
    if (!result.approved) {
      return result;
    }
  }
  return hook_result::approve();
}

}  // namespace tranche::hooks
