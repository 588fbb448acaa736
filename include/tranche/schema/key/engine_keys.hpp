#pragma once

#include <tranche/schema/operation_tag.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/role_id.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical RocksDB key prefixes. Every state row lives under kStatePrefix so
// a commit can replace the whole state keyspace in one write batch.
namespace tranche::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kClockKey{"SYS|STATE|CLOCK"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|STATE|ROLE|"};
inline constexpr std::string_view kAssetBalanceKeyPrefix{
    "SYS|STATE|ASSET_BALANCE|"};
inline constexpr std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
inline constexpr std::string_view kEscrowKeyPrefix{"SYS|STATE|ESCROW|"};
inline constexpr std::string_view kOracleKeyPrefix{"SYS|STATE|ORACLE|"};
inline constexpr std::string_view kHookKeyPrefix{"SYS|STATE|HOOK|"};
inline constexpr std::string_view kWithdrawalNonceKeyPrefix{
    "SYS|STATE|WITHDRAWAL_NONCE|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

inline constexpr std::array<std::string_view, 11> kEngineKeyspaces{
    kStatePrefix,
    kClockKey,
    kNonceKeyPrefix,
    kRoleKeyPrefix,
    kAssetBalanceKeyPrefix,
    kVaultKeyPrefix,
    kEscrowKeyPrefix,
    kOracleKeyPrefix,
    kHookKeyPrefix,
    kWithdrawalNonceKeyPrefix,
    kHistoryPrefix};

/// Raw prefix bytes followed by the SCALE encoding of `id`.
template <typename Encoder, typename T>
tranche::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  auto key = tranche::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

inline tranche::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return tranche::schema::make_bytes(prefix);
}

template <typename Encoder>
tranche::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const tranche::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, account);
}

template <typename Encoder>
tranche::schema::bytes_t make_role_key(
    Encoder& encoder,
    const tranche::schema::account_id_t& subject,
    const tranche::schema::role_id_t role) {
  return make_prefixed_key(encoder, kRoleKeyPrefix, std::tuple{subject, role});
}

template <typename Encoder>
tranche::schema::bytes_t make_asset_balance_key(
    Encoder& encoder,
    const tranche::schema::asset_id_t& asset_id,
    const tranche::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kAssetBalanceKeyPrefix,
                           std::tuple{asset_id, account});
}

template <typename Encoder>
tranche::schema::bytes_t make_vault_key(
    Encoder& encoder,
    const tranche::schema::hash32_t& vault_id) {
  return make_prefixed_key(encoder, kVaultKeyPrefix, vault_id);
}

template <typename Encoder>
tranche::schema::bytes_t make_escrow_key(
    Encoder& encoder,
    const tranche::schema::hash32_t& vault_id) {
  return make_prefixed_key(encoder, kEscrowKeyPrefix, vault_id);
}

template <typename Encoder>
tranche::schema::bytes_t make_oracle_key(
    Encoder& encoder,
    const tranche::schema::hash32_t& oracle_id) {
  return make_prefixed_key(encoder, kOracleKeyPrefix, oracle_id);
}

template <typename Encoder>
tranche::schema::bytes_t make_hook_key(
    Encoder& encoder,
    const tranche::schema::hash32_t& hook_id) {
  return make_prefixed_key(encoder, kHookKeyPrefix, hook_id);
}

template <typename Encoder>
tranche::schema::bytes_t make_withdrawal_nonce_key(
    Encoder& encoder,
    const tranche::schema::hash32_t& vault_id) {
  return make_prefixed_key(encoder, kWithdrawalNonceKeyPrefix, vault_id);
}

template <typename Encoder>
tranche::schema::bytes_t make_history_key(Encoder& encoder,
                                          const uint64_t height,
                                          const uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

}  // namespace tranche::schema::key
