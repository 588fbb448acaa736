#include <tranche/hooks/composite_hook.hpp>

namespace tranche::hooks {

composite_hook::composite_hook(
    const tranche::schema::composite_hook_config_t& config,
    const hook_resolver& resolver)
    : config_{config}, resolver_{resolver} {}

hook_result composite_hook::on_before_deposit(
    const hook_context& context) const {
  return evaluate_in_order(config_.children, context, resolver_);
}

hook_result composite_hook::on_before_withdraw(
    const hook_context& context) const {
  return evaluate_in_order(config_.children, context, resolver_);
}

hook_result composite_hook::on_before_transfer(
    const hook_context& context) const {
  return evaluate_in_order(config_.children, context, resolver_);
}

}  // namespace tranche::hooks
