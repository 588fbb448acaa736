#pragma once

#include <tranche/schema/asset_balance.hpp>
#include <tranche/schema/primitives.hpp>

#include <vector>

namespace tranche::vault {

/// Guarded mover of underlying assets.
class asset_relay {
 public:
  virtual ~asset_relay() = default;

  /// Move `amount` of `asset` from `from` to `to`. False when the movement
  /// is not permitted or not covered; nothing moves in that case.
  virtual bool pull(const tranche::schema::asset_id_t& asset,
                    const tranche::schema::account_id_t& from,
                    const tranche::schema::account_id_t& to,
                    const tranche::schema::amount_t& amount) = 0;

  virtual tranche::schema::amount_t balance_of(
      const tranche::schema::asset_id_t& asset,
      const tranche::schema::account_id_t& account) const = 0;
};

/// Balance book of underlying assets.
///
/// Pulls are only honoured when one side is a recognised custody account,
/// the relay's notion of a recognised destination.
class asset_ledger final : public asset_relay {
 public:
  asset_ledger(std::vector<tranche::schema::asset_balance_t>& balances,
               std::vector<tranche::schema::account_id_t> custody_accounts);

  bool pull(const tranche::schema::asset_id_t& asset,
            const tranche::schema::account_id_t& from,
            const tranche::schema::account_id_t& to,
            const tranche::schema::amount_t& amount) override;

  void credit(const tranche::schema::asset_id_t& asset,
              const tranche::schema::account_id_t& account,
              const tranche::schema::amount_t& amount);

  tranche::schema::amount_t balance_of(
      const tranche::schema::asset_id_t& asset,
      const tranche::schema::account_id_t& account) const override;

  bool is_custody(const tranche::schema::account_id_t& account) const;

 private:
  std::vector<tranche::schema::asset_balance_t>& balances_;
  std::vector<tranche::schema::account_id_t> custody_accounts_;
};

}  // namespace tranche::vault
