#pragma once

#include <tranche/hooks/operation_hook.hpp>
#include <tranche/schema/hook_record.hpp>

namespace tranche::hooks {

/// Aggregates child hooks and evaluates them with `evaluate_in_order`, the
/// same algorithm a pipeline applies to its own list.
class composite_hook final : public operation_hook {
 public:
  composite_hook(const tranche::schema::composite_hook_config_t& config,
                 const hook_resolver& resolver);

  hook_result on_before_deposit(const hook_context& context) const override;
  hook_result on_before_withdraw(const hook_context& context) const override;
  hook_result on_before_transfer(const hook_context& context) const override;

 private:
  const tranche::schema::composite_hook_config_t& config_;
  const hook_resolver& resolver_;
};

}  // namespace tranche::hooks
