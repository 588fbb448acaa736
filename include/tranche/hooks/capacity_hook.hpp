#pragma once

#include <tranche/hooks/operation_hook.hpp>
#include <tranche/schema/hook_record.hpp>

namespace tranche::hooks {

/// Deposit cap on the vault's total assets. Withdrawals and transfers pass.
class capacity_hook final : public operation_hook {
 public:
  explicit capacity_hook(const tranche::schema::capacity_hook_config_t& config);

  hook_result on_before_deposit(const hook_context& context) const override;
  hook_result on_before_withdraw(const hook_context& context) const override;
  hook_result on_before_transfer(const hook_context& context) const override;

 private:
  const tranche::schema::capacity_hook_config_t& config_;
};

}  // namespace tranche::hooks
