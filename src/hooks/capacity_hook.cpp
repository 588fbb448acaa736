#include <fmt/format.h>
#include <tranche/hooks/capacity_hook.hpp>

namespace tranche::hooks {

capacity_hook::capacity_hook(
    const tranche::schema::capacity_hook_config_t& config)
    : config_{config} {}

hook_result capacity_hook::on_before_deposit(
    const hook_context& context) const {
  if (context.total_assets + context.assets > config_.max_total_assets) {
    return hook_result::reject(
        fmt::format("deposit of {} exceeds vault capacity {} (holding {})",
                    context.assets.str(), config_.max_total_assets.str(),
                    context.total_assets.str()));
  }
  return hook_result::approve();
}

hook_result capacity_hook::on_before_withdraw(const hook_context&) const {
  return hook_result::approve();
}

hook_result capacity_hook::on_before_transfer(const hook_context&) const {
  return hook_result::approve();
}

}  // namespace tranche::hooks
