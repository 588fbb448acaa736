#include <algorithm>
#include <fmt/format.h>
#include <tranche/hooks/allow_list_hook.hpp>
#include <tranche/hooks/capacity_hook.hpp>
#include <tranche/hooks/composite_hook.hpp>
#include <tranche/hooks/hook_set.hpp>

using tranche::schema::transaction_error_code;

namespace tranche::hooks {

hook_set::hook_set(
    const std::map<tranche::schema::hash32_t, tranche::schema::hook_record_t>&
        records) {
  for (const auto& [hook_id, record] : records) {
    hooks_[hook_id] = std::visit(
        overloaded{
            [](const tranche::schema::allow_list_hook_config_t& config)
                -> std::unique_ptr<operation_hook> {
              return std::make_unique<allow_list_hook>(config);
            },
            [](const tranche::schema::capacity_hook_config_t& config)
                -> std::unique_ptr<operation_hook> {
              return std::make_unique<capacity_hook>(config);
            },
            [this](const tranche::schema::composite_hook_config_t& config)
                -> std::unique_ptr<operation_hook> {
              return std::make_unique<composite_hook>(config, *this);
            }},
        record.config);
  }
}

const operation_hook* hook_set::find(
    const tranche::schema::hash32_t& hook_id) const {
  auto it = hooks_.find(hook_id);
  if (it == std::end(hooks_)) {
    return nullptr;
  }
  return it->second.get();
}

tranche::common::outcome<> validate_registration(
    const std::map<tranche::schema::hash32_t, tranche::schema::hook_record_t>&
        records,
    const tranche::schema::hook_record_t& candidate) {
  if (tranche::schema::is_null_account(candidate.hook_id)) {
    return tranche::common::failure{transaction_error_code::invalid_hook,
                                    "hook id must not be null"};
  }
  if (records.contains(candidate.hook_id)) {
    return tranche::common::failure{transaction_error_code::hook_exists,
                                    "hook id already registered"};
  }
  if (const auto* capacity =
          std::get_if<tranche::schema::capacity_hook_config_t>(
              &candidate.config)) {
    if (capacity->max_total_assets == 0) {
      return tranche::common::failure{transaction_error_code::invalid_amount,
                                      "capacity must be positive"};
    }
  }
  if (const auto* composite =
          std::get_if<tranche::schema::composite_hook_config_t>(
              &candidate.config)) {
    for (const auto& child : composite->children) {
      if (!records.contains(child)) {
        return tranche::common::failure{
            transaction_error_code::hook_missing,
            fmt::format("composite child {} is not registered",
                        tranche::schema::to_hex(
                            tranche::schema::bytes_view_t{child}))};
      }
    }
  }
  return {};
}

}  // namespace tranche::hooks
