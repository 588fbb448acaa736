#pragma once

#include <tranche/schema/primitives.hpp>

#include <cstdint>
#include <variant>
#include <vector>

// Schema type: hook record.
// Persisted configuration of a registered hook. The engine rebuilds the
// polymorphic hook objects from these records for every transaction.
namespace tranche::schema {

template <uint16_t Version>
struct allow_list_hook_config;

/// Approves an operation when every non-null party is listed. With
/// `deny_listed` set the list becomes a deny list instead.
template <>
struct allow_list_hook_config<1> final {
  uint16_t version{1};
  bool deny_listed{};
  std::vector<account_id_t> accounts;
};

using allow_list_hook_config_t = allow_list_hook_config<1>;

template <uint16_t Version>
struct capacity_hook_config;

/// Rejects deposits that would lift the vault's total assets above the cap.
template <>
struct capacity_hook_config<1> final {
  uint16_t version{1};
  amount_t max_total_assets{};
};

using capacity_hook_config_t = capacity_hook_config<1>;

template <uint16_t Version>
struct composite_hook_config;

/// Ordered children evaluated with the pipeline's own algorithm.
template <>
struct composite_hook_config<1> final {
  uint16_t version{1};
  std::vector<hash32_t> children;
};

using composite_hook_config_t = composite_hook_config<1>;

using hook_config_t = std::variant<allow_list_hook_config_t,
                                   capacity_hook_config_t,
                                   composite_hook_config_t>;

template <uint16_t Version>
struct hook_record;

template <>
struct hook_record<1> final {
  uint16_t version{1};
  hash32_t hook_id{};
  hook_config_t config{};
};

using hook_record_t = hook_record<1>;

}  // namespace tranche::schema
