#include <algorithm>
#include <fmt/format.h>
#include <tranche/hooks/allow_list_hook.hpp>

namespace tranche::hooks {

allow_list_hook::allow_list_hook(
    const tranche::schema::allow_list_hook_config_t& config)
    : config_{config} {}

hook_result allow_list_hook::screen(
    const tranche::schema::account_id_t& party) const {
  if (tranche::schema::is_null_account(party)) {
    return hook_result::approve();
  }
  auto listed = std::binary_search(std::begin(config_.accounts),
                                   std::end(config_.accounts), party);
  if (listed != config_.deny_listed) {
    return hook_result::approve();
  }
  return hook_result::reject(fmt::format(
      "account {} is {}",
      tranche::schema::to_hex(tranche::schema::bytes_view_t{party}),
      config_.deny_listed ? "denied" : "not allowed"));
}

hook_result allow_list_hook::screen_parties(const hook_context& context) const {
  auto first = screen(context.from);
  if (!first.approved) {
    return first;
  }
  return screen(context.to);
}

hook_result allow_list_hook::on_before_deposit(
    const hook_context& context) const {
  return screen_parties(context);
}

hook_result allow_list_hook::on_before_withdraw(
    const hook_context& context) const {
  return screen_parties(context);
}

hook_result allow_list_hook::on_before_transfer(
    const hook_context& context) const {
  return screen_parties(context);
}

void set_listed(tranche::schema::allow_list_hook_config_t& config,
                const tranche::schema::account_id_t& account,
                const bool listed) {
  auto& accounts = config.accounts;
  auto it = std::lower_bound(std::begin(accounts), std::end(accounts), account);
  auto present = it != std::end(accounts) && *it == account;
  if (listed && !present) {
    accounts.insert(it, account);
  } else if (!listed && present) {
    accounts.erase(it);
  }
}

}  // namespace tranche::hooks
