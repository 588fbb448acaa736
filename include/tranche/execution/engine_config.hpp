#pragma once

#include <tranche/schema/primitives.hpp>

namespace tranche::execution {

struct engine_config_t final {
  tranche::schema::hash32_t chain_id{};
  /// Granted the admin role at genesis. Ignored once state was persisted.
  tranche::schema::account_id_t genesis_admin{};
  /// Verify envelope signatures. Off only for local tooling and tests.
  bool require_strict_crypto{true};
};

}  // namespace tranche::execution
