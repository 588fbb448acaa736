#include <algorithm>
#include <spdlog/spdlog.h>
#include <tranche/vault/asset_relay.hpp>
#include <tuple>

namespace tranche::vault {

namespace {

bool balance_less(const tranche::schema::asset_balance_t& lhs,
                  const tranche::schema::asset_balance_t& rhs) {
  return std::tie(lhs.asset_id, lhs.account) <
         std::tie(rhs.asset_id, rhs.account);
}

}  // namespace

asset_ledger::asset_ledger(
    std::vector<tranche::schema::asset_balance_t>& balances,
    std::vector<tranche::schema::account_id_t> custody_accounts)
    : balances_{balances}, custody_accounts_{std::move(custody_accounts)} {
  std::sort(std::begin(custody_accounts_), std::end(custody_accounts_));
}

bool asset_ledger::is_custody(
    const tranche::schema::account_id_t& account) const {
  return std::binary_search(std::begin(custody_accounts_),
                            std::end(custody_accounts_), account);
}

tranche::schema::amount_t asset_ledger::balance_of(
    const tranche::schema::asset_id_t& asset,
    const tranche::schema::account_id_t& account) const {
  auto lookup =
      tranche::schema::asset_balance_t{.asset_id = asset, .account = account};
  auto it = std::lower_bound(std::begin(balances_), std::end(balances_), lookup,
                             balance_less);
  if (it == std::end(balances_) || balance_less(lookup, *it)) {
    return 0;
  }
  return it->amount;
}

void asset_ledger::credit(const tranche::schema::asset_id_t& asset,
                          const tranche::schema::account_id_t& account,
                          const tranche::schema::amount_t& amount) {
  if (amount == 0) {
    return;
  }
  auto lookup = tranche::schema::asset_balance_t{
      .asset_id = asset, .account = account, .amount = amount};
  auto it = std::lower_bound(std::begin(balances_), std::end(balances_), lookup,
                             balance_less);
  if (it == std::end(balances_) || balance_less(lookup, *it)) {
    balances_.insert(it, lookup);
    return;
  }
  it->amount += amount;
}

bool asset_ledger::pull(const tranche::schema::asset_id_t& asset,
                        const tranche::schema::account_id_t& from,
                        const tranche::schema::account_id_t& to,
                        const tranche::schema::amount_t& amount) {
  if (!is_custody(from) && !is_custody(to)) {
    spdlog::debug("asset pull rejected: neither side is a custody account");
    return false;
  }
  if (tranche::schema::is_null_account(from) ||
      tranche::schema::is_null_account(to)) {
    return false;
  }
  auto lookup =
      tranche::schema::asset_balance_t{.asset_id = asset, .account = from};
  auto it = std::lower_bound(std::begin(balances_), std::end(balances_), lookup,
                             balance_less);
  if (it == std::end(balances_) || balance_less(lookup, *it) ||
      it->amount < amount) {
    spdlog::debug("asset pull rejected: insufficient source balance");
    return false;
  }
  it->amount -= amount;
  if (it->amount == 0) {
    balances_.erase(it);
  }
  credit(asset, to, amount);
  return true;
}

}  // namespace tranche::vault
