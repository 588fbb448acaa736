#pragma once

#include <cstdint>

// Schema type: transaction error code.
// Stable numeric codes reported in transaction results. Ranges group the
// failure family: envelope (1-9), authorization (10-19), validation (20-39),
// state (40-59), policy (60-79) and hook rejection (80).
namespace tranche::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,

  unauthorized = 10,
  reentrant_call = 11,

  invalid_amount = 20,
  invalid_account = 21,
  invalid_hook = 22,
  invalid_index = 23,
  invalid_order = 24,
  invalid_array_lengths = 25,
  empty_source = 26,
  invalid_price = 27,
  invalid_oracle_policy = 28,
  invalid_identifier = 29,

  vault_exists = 40,
  vault_missing = 41,
  hook_exists = 42,
  hook_missing = 43,
  hook_removal_blocked = 44,
  hook_type_mismatch = 45,
  deposit_not_found = 46,
  deposit_not_pending = 47,
  deposit_not_reclaimable = 48,
  oracle_exists = 49,
  oracle_missing = 50,
  withdrawal_request_expired = 51,
  withdraw_nonce_reuse = 52,
  withdraw_invalid_signature = 53,
  operation_disabled = 54,
  insufficient_balance = 55,
  insufficient_allowance = 56,
  asset_transfer_failed = 57,

  insufficient_output_assets = 60,
  exceeds_max_withdraw = 61,
  exceeds_max_redeem = 62,
  zero_shares = 63,

  hook_check_failed = 80,
};

}  // namespace tranche::schema
