#include <tranche/escrow/deposit_escrow.hpp>
#include <tranche/hooks/allow_list_hook.hpp>
#include <tranche/testing/vault_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

namespace {

using tranche::schema::amount_t;
using tranche::schema::deposit_status_t;
using tranche::schema::hash32_t;
using tranche::schema::operation_tag_t;
using tranche::schema::transaction_error_code;
using tranche::testing::make_hash;
using tranche::testing::vault_fixture;
using tranche::testing::vault_options;

const auto& kAlice = vault_fixture::kAlice;
const auto& kBob = vault_fixture::kBob;
const auto& kCarol = vault_fixture::kCarol;
const auto& kManager = vault_fixture::kManager;
const auto& kOperator = vault_fixture::kOperator;

vault_options gated(const tranche::schema::duration_seconds_t expiration = 3600) {
  return vault_options{.gated_deposits = true,
                       .deposit_expiration_seconds = expiration};
}

hash32_t request(vault_fixture& fixture,
                 const tranche::schema::account_id_t& depositor,
                 const amount_t& amount,
                 const tranche::schema::account_id_t& recipient) {
  auto requested =
      fixture.escrow().request_deposit(fixture.as(depositor), amount, recipient);
  EXPECT_TRUE(requested.ok()) << requested.reason;
  return requested.value;
}

bool emitted(vault_fixture& fixture, std::string_view type) {
  const auto& events = fixture.events();
  return std::any_of(std::begin(events), std::end(events),
                     [&](const auto& event) { return event.type == type; });
}

}  // namespace

TEST(deposit_escrow, request_holds_assets_in_escrow_custody) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 1000);

  auto id = request(fixture, kAlice, 400, kCarol);
  const auto* deposit = fixture.escrow().find(id);
  ASSERT_NE(deposit, nullptr);
  EXPECT_EQ(deposit->status, deposit_status_t::pending);
  EXPECT_EQ(deposit->depositor, kAlice);
  EXPECT_EQ(deposit->recipient, kCarol);
  EXPECT_EQ(deposit->amount, 400);
  EXPECT_EQ(deposit->round_at_creation, 0u);
  EXPECT_EQ(deposit->expiration, fixture.now() + 3600);

  EXPECT_EQ(fixture.escrow_custody(), 400);
  EXPECT_EQ(fixture.vault_custody(), 0);
  EXPECT_EQ(fixture.assets_of(kAlice), 600);
  EXPECT_EQ(fixture.escrow().total_pending(), 400);
  EXPECT_EQ(fixture.escrow().user_pending(kAlice), 400);
  EXPECT_EQ(fixture.vault().total_supply(), 0);
  EXPECT_EQ(fixture.vault().watermark(operation_tag_t::deposit),
            fixture.sequence());
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  EXPECT_TRUE(emitted(fixture, "deposit_pending"));
}

TEST(deposit_escrow, gated_vault_refuses_direct_deposits) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 100);
  EXPECT_EQ(fixture.vault().deposit(fixture.as(kAlice), 100, kAlice).code,
            transaction_error_code::operation_disabled);
  EXPECT_EQ(fixture.vault().mint(fixture.as(kAlice), 100, kAlice).code,
            transaction_error_code::operation_disabled);
}

TEST(deposit_escrow, identical_requests_get_distinct_ids) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 200);
  auto first = request(fixture, kAlice, 100, kAlice);
  auto second = request(fixture, kAlice, 100, kAlice);
  EXPECT_NE(first, second);
  EXPECT_EQ(fixture.escrow().user_pending(kAlice), 200);
}

TEST(deposit_escrow, request_runs_deposit_hooks) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 100);
  auto config = tranche::schema::allow_list_hook_config_t{};
  tranche::hooks::set_listed(config, kBob, true);
  fixture.register_hook(
      tranche::schema::hook_record_t{.hook_id = make_hash(0x70), .config = config});
  ASSERT_TRUE(fixture.vault()
                  .add_hook(fixture.as(kManager), operation_tag_t::deposit,
                            make_hash(0x70))
                  .ok());

  auto rejected =
      fixture.escrow().request_deposit(fixture.as(kAlice), 100, kAlice);
  EXPECT_EQ(rejected.code, transaction_error_code::hook_check_failed);
  EXPECT_EQ(fixture.assets_of(kAlice), 100);
  EXPECT_TRUE(fixture.escrow_state().deposits.empty());
}

TEST(deposit_escrow, refund_returns_assets_once) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 500);
  auto id = request(fixture, kAlice, 500, kAlice);
  ASSERT_EQ(fixture.escrow().user_pending(kAlice), 500);

  ASSERT_TRUE(fixture.escrow().refund_deposit(fixture.as(kOperator), id).ok());
  EXPECT_EQ(fixture.escrow().user_pending(kAlice), 0);
  EXPECT_EQ(fixture.escrow().find(id)->status, deposit_status_t::refunded);
  EXPECT_EQ(fixture.assets_of(kAlice), 500);
  EXPECT_EQ(fixture.escrow().round(), 1u);
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  EXPECT_TRUE(emitted(fixture, "deposit_refunded"));

  EXPECT_EQ(fixture.escrow().refund_deposit(fixture.as(kOperator), id).code,
            transaction_error_code::deposit_not_pending);
  EXPECT_EQ(fixture.escrow().round(), 1u);
}

TEST(deposit_escrow, accept_mints_shares_to_the_recipient) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 400);
  auto id = request(fixture, kAlice, 400, kCarol);

  ASSERT_TRUE(fixture.escrow().accept_deposit(fixture.as(kOperator), id).ok());
  EXPECT_EQ(fixture.escrow().find(id)->status, deposit_status_t::accepted);
  EXPECT_EQ(fixture.vault().balance_of(kCarol), 400);
  EXPECT_EQ(fixture.vault().total_supply(), 400);
  EXPECT_EQ(fixture.vault_custody(), 400);
  EXPECT_EQ(fixture.escrow_custody(), 0);
  EXPECT_EQ(fixture.escrow().total_pending(), 0);
  EXPECT_EQ(fixture.escrow().round(), 1u);
  EXPECT_EQ(fixture.vault().watermark(operation_tag_t::transfer),
            fixture.sequence());
  EXPECT_TRUE(emitted(fixture, "deposit_accepted"));
  EXPECT_TRUE(emitted(fixture, "vault_mint"));

  EXPECT_EQ(fixture.escrow().accept_deposit(fixture.as(kOperator), id).code,
            transaction_error_code::deposit_not_pending);
}

TEST(deposit_escrow, batch_accept_keeps_rounding_dust) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kCarol, 1000);
  fixture.fund(kAlice, 100);
  fixture.fund(kBob, 101);
  auto seed = request(fixture, kCarol, 1000, kCarol);
  ASSERT_TRUE(fixture.escrow().accept_deposit(fixture.as(kOperator), seed).ok());
  fixture.fund(tranche::vault::make_vault_custody_account(vault_fixture::kVaultId),
               500);

  auto first = request(fixture, kAlice, 100, kAlice);
  auto second = request(fixture, kBob, 101, kBob);
  auto total_shares = fixture.vault().preview_deposit(201, fixture.now());
  ASSERT_EQ(total_shares, 134);

  ASSERT_TRUE(fixture.escrow()
                  .batch_accept_deposits(fixture.as(kOperator), {first, second})
                  .ok());
  EXPECT_EQ(fixture.vault().balance_of(kAlice), 66);
  EXPECT_EQ(fixture.vault().balance_of(kBob), 67);
  EXPECT_LT(fixture.vault().balance_of(kAlice) + fixture.vault().balance_of(kBob),
            total_shares);
  EXPECT_EQ(fixture.vault_custody(), 1701);
  EXPECT_EQ(fixture.escrow().round(), 2u);
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  EXPECT_TRUE(emitted(fixture, "deposits_batch_accepted"));
}

TEST(deposit_escrow, accept_refuses_a_deposit_worth_no_shares) {
  auto price = tranche::testing::fixed_price{tranche::testing::make_units(2)};
  auto options = gated();
  options.valuation = &price;
  auto fixture = vault_fixture{options};
  fixture.fund(kAlice, 10);
  fixture.fund(kBob, 1);
  auto seed = request(fixture, kAlice, 10, kAlice);
  ASSERT_TRUE(fixture.escrow().accept_deposit(fixture.as(kOperator), seed).ok());
  ASSERT_EQ(fixture.vault().balance_of(kAlice), 10);
  ASSERT_EQ(fixture.vault().total_assets(fixture.now()), 20);

  // 1 * (10 + 1) / (20 + 1) rounds down to nothing.
  auto dust = request(fixture, kBob, 1, kBob);
  ASSERT_EQ(fixture.vault().preview_deposit(1, fixture.now()), 0);
  EXPECT_EQ(fixture.escrow().accept_deposit(fixture.as(kOperator), dust).code,
            transaction_error_code::zero_shares);
  EXPECT_EQ(fixture.escrow()
                .batch_accept_deposits(fixture.as(kOperator), {dust})
                .code,
            transaction_error_code::zero_shares);
  EXPECT_EQ(fixture.escrow().find(dust)->status, deposit_status_t::pending);
  EXPECT_EQ(fixture.escrow_custody(), 1);
  EXPECT_EQ(fixture.vault_custody(), 10);
  EXPECT_EQ(fixture.escrow().user_pending(kBob), 1);
  EXPECT_EQ(fixture.escrow().round(), 1u);
  EXPECT_EQ(fixture.vault().balance_of(kBob), 0);
  EXPECT_TRUE(fixture.escrow_ledger_balanced());

  ASSERT_TRUE(fixture.escrow().refund_deposit(fixture.as(kOperator), dust).ok());
  EXPECT_EQ(fixture.assets_of(kBob), 1);
  EXPECT_EQ(fixture.escrow().total_pending(), 0);
}

TEST(deposit_escrow, batch_refund_advances_the_round_once) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 100);
  fixture.fund(kBob, 100);
  auto first = request(fixture, kAlice, 100, kAlice);
  auto second = request(fixture, kBob, 100, kBob);

  ASSERT_TRUE(fixture.escrow()
                  .batch_refund_deposits(fixture.as(kOperator), {first, second})
                  .ok());
  EXPECT_EQ(fixture.escrow().round(), 1u);
  EXPECT_EQ(fixture.assets_of(kAlice), 100);
  EXPECT_EQ(fixture.assets_of(kBob), 100);
  EXPECT_EQ(fixture.escrow().total_pending(), 0);
  EXPECT_TRUE(emitted(fixture, "deposits_batch_refunded"));
}

TEST(deposit_escrow, resolution_is_operator_only_and_validated) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 100);
  auto id = request(fixture, kAlice, 100, kAlice);

  EXPECT_EQ(fixture.escrow().accept_deposit(fixture.as(kAlice), id).code,
            transaction_error_code::unauthorized);
  EXPECT_EQ(fixture.escrow().refund_deposit(fixture.as(kBob), id).code,
            transaction_error_code::unauthorized);
  EXPECT_EQ(fixture.escrow()
                .accept_deposit(fixture.as(kOperator), make_hash(0x99))
                .code,
            transaction_error_code::deposit_not_found);
  EXPECT_EQ(fixture.escrow().batch_accept_deposits(fixture.as(kOperator), {}).code,
            transaction_error_code::invalid_array_lengths);
  EXPECT_EQ(fixture.escrow()
                .batch_refund_deposits(fixture.as(kOperator), {id, id})
                .code,
            transaction_error_code::deposit_not_pending);

  EXPECT_EQ(fixture.escrow().round(), 0u);
  EXPECT_EQ(fixture.escrow().find(id)->status, deposit_status_t::pending);
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
}

TEST(deposit_escrow, advancing_round_makes_deposit_reclaimable) {
  auto fixture = vault_fixture{gated()};
  fixture.fund(kAlice, 300);
  fixture.fund(kBob, 50);
  auto stale = request(fixture, kAlice, 300, kAlice);

  EXPECT_EQ(fixture.escrow().reclaim_deposit(fixture.as(kAlice), stale).code,
            transaction_error_code::deposit_not_reclaimable);
  EXPECT_EQ(fixture.escrow().reclaim_deposit(fixture.as(kBob), stale).code,
            transaction_error_code::unauthorized);

  auto other = request(fixture, kBob, 50, kBob);
  ASSERT_TRUE(fixture.escrow().refund_deposit(fixture.as(kOperator), other).ok());
  ASSERT_EQ(fixture.escrow().round(), 1u);

  EXPECT_EQ(fixture.escrow().reclaim_deposit(fixture.as(kBob), stale).code,
            transaction_error_code::unauthorized);
  ASSERT_TRUE(fixture.escrow().reclaim_deposit(fixture.as(kAlice), stale).ok());
  EXPECT_EQ(fixture.escrow().find(stale)->status, deposit_status_t::refunded);
  EXPECT_EQ(fixture.assets_of(kAlice), 300);
  EXPECT_EQ(fixture.escrow().round(), 1u);
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  EXPECT_TRUE(emitted(fixture, "deposit_reclaimed"));

  EXPECT_EQ(fixture.escrow().reclaim_deposit(fixture.as(kAlice), stale).code,
            transaction_error_code::deposit_not_pending);
}

TEST(deposit_escrow, expired_deposit_is_reclaimable) {
  auto fixture = vault_fixture{gated(60)};
  fixture.fund(kAlice, 10);
  auto id = request(fixture, kAlice, 10, kAlice);

  fixture.advance(59);
  EXPECT_EQ(fixture.escrow().reclaim_deposit(fixture.as(kAlice), id).code,
            transaction_error_code::deposit_not_reclaimable);
  fixture.advance(1);
  ASSERT_TRUE(fixture.escrow().reclaim_deposit(fixture.as(kAlice), id).ok());
  EXPECT_EQ(fixture.assets_of(kAlice), 10);
}

TEST(deposit_escrow, ledger_stays_balanced_across_mixed_operations) {
  auto fixture = vault_fixture{gated(120)};
  fixture.fund(kAlice, 1000);
  fixture.fund(kBob, 1000);

  auto a1 = request(fixture, kAlice, 100, kAlice);
  auto a2 = request(fixture, kAlice, 250, kCarol);
  auto b1 = request(fixture, kBob, 75, kBob);
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  EXPECT_EQ(fixture.escrow().total_pending(), 425);

  ASSERT_TRUE(fixture.escrow().accept_deposit(fixture.as(kOperator), a2).ok());
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  ASSERT_TRUE(fixture.escrow().reclaim_deposit(fixture.as(kBob), b1).ok());
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  auto b2 = request(fixture, kBob, 30, kBob);
  ASSERT_TRUE(fixture.escrow()
                  .batch_refund_deposits(fixture.as(kOperator), {a1, b2})
                  .ok());
  EXPECT_TRUE(fixture.escrow_ledger_balanced());
  EXPECT_EQ(fixture.escrow().total_pending(), 0);
  EXPECT_EQ(fixture.escrow().user_pending(kAlice), 0);
  EXPECT_EQ(fixture.escrow().user_pending(kBob), 0);
  EXPECT_EQ(fixture.escrow_custody(), 0);
}
