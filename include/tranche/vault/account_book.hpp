#pragma once

#include <tranche/schema/account_amount.hpp>

#include <algorithm>
#include <vector>

// Sorted (account, amount) rows. Rows reaching zero are erased so equal
// ledgers always encode identically.
namespace tranche::vault {

namespace detail {

inline auto lower_bound_account(
    std::vector<tranche::schema::account_amount_t>& book,
    const tranche::schema::account_id_t& account) {
  return std::lower_bound(
      std::begin(book), std::end(book), account,
      [](const tranche::schema::account_amount_t& row,
         const tranche::schema::account_id_t& key) { return row.account < key; });
}

}  // namespace detail

inline tranche::schema::amount_t amount_of(
    const std::vector<tranche::schema::account_amount_t>& book,
    const tranche::schema::account_id_t& account) {
  auto it = std::lower_bound(
      std::begin(book), std::end(book), account,
      [](const tranche::schema::account_amount_t& row,
         const tranche::schema::account_id_t& key) { return row.account < key; });
  if (it == std::end(book) || it->account != account) {
    return 0;
  }
  return it->amount;
}

inline void add_amount(std::vector<tranche::schema::account_amount_t>& book,
                       const tranche::schema::account_id_t& account,
                       const tranche::schema::amount_t& amount) {
  if (amount == 0) {
    return;
  }
  auto it = detail::lower_bound_account(book, account);
  if (it == std::end(book) || it->account != account) {
    book.insert(it, tranche::schema::account_amount_t{.account = account,
                                                      .amount = amount});
    return;
  }
  it->amount += amount;
}

/// False, and no change, when the row does not cover `amount`.
inline bool subtract_amount(std::vector<tranche::schema::account_amount_t>& book,
                            const tranche::schema::account_id_t& account,
                            const tranche::schema::amount_t& amount) {
  if (amount == 0) {
    return true;
  }
  auto it = detail::lower_bound_account(book, account);
  if (it == std::end(book) || it->account != account || it->amount < amount) {
    return false;
  }
  it->amount -= amount;
  if (it->amount == 0) {
    book.erase(it);
  }
  return true;
}

}  // namespace tranche::vault
