#pragma once

#include <tranche/hooks/operation_hook.hpp>
#include <tranche/schema/hook_record.hpp>

namespace tranche::hooks {

/// Screens the non-null parties of every operation against a list of
/// accounts. Deposits screen the actor and receiver, withdrawals the owner
/// and receiver, transfers the sender and recipient.
class allow_list_hook final : public operation_hook {
 public:
  explicit allow_list_hook(
      const tranche::schema::allow_list_hook_config_t& config);

  hook_result on_before_deposit(const hook_context& context) const override;
  hook_result on_before_withdraw(const hook_context& context) const override;
  hook_result on_before_transfer(const hook_context& context) const override;

 private:
  hook_result screen(const tranche::schema::account_id_t& party) const;
  hook_result screen_parties(const hook_context& context) const;

  const tranche::schema::allow_list_hook_config_t& config_;
};

/// Insert or erase `account`; the list stays sorted.
void set_listed(tranche::schema::allow_list_hook_config_t& config,
                const tranche::schema::account_id_t& account,
                bool listed);

}  // namespace tranche::hooks
