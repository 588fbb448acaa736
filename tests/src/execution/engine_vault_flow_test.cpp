#include <tranche/execution/engine.hpp>
#include <tranche/schema/hook_entry.hpp>
#include <tranche/schema/hook_record.hpp>
#include <tranche/schema/pending_deposit.hpp>
#include <tranche/schema/transaction_error_code.hpp>
#include <tranche/schema/vault_state.hpp>
#include <tranche/testing/execution_fixture.hpp>
#include <tranche/vault/share_vault.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using tranche::schema::account_amount_t;
using tranche::schema::amount_t;
using tranche::schema::hash32_t;
using tranche::schema::operation_tag_t;
using tranche::schema::transaction_error_code;
using tranche::testing::execution_fixture;
using tranche::testing::make_hash;
using tranche::testing::make_named_account;
using tranche::testing::make_named_signer;
using tranche::testing::make_units;
using tranche::testing::query_value;

const auto kAssetId = make_hash(0x50);
const auto kVaultId = make_hash(0x40);
const auto kOracleId = make_hash(0x60);
const auto kHookId = make_hash(0x70);

const auto kManager = make_named_signer(0x02);
const auto kOperator = make_named_signer(0x03);
const auto kAlice = make_named_signer(0x10);
const auto kBob = make_named_signer(0x20);
const auto kManagerAccount = make_named_account(0x02);
const auto kOperatorAccount = make_named_account(0x03);
const auto kAliceAccount = make_named_account(0x10);
const auto kBobAccount = make_named_account(0x20);

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

bool has_event(const tranche::schema::transaction_result_t& result,
               std::string_view type) {
  return std::any_of(std::begin(result.events), std::end(result.events),
                     [&](const auto& event) { return event.type == type; });
}

/// Admin grants the manager and operator roles and funds alice and bob.
void bootstrap(execution_fixture& fixture,
               tranche::schema::create_vault_t vault) {
  auto admin = execution_fixture::admin();
  auto grant = [&](const auto& subject, const auto role) {
    ASSERT_EQ(fixture
                  .submit(admin, tranche::schema::upsert_role_assignment_t{
                                     .subject = subject, .role = role})
                  .code,
              0u);
  };
  grant(kManagerAccount, tranche::schema::role_id_t::manager);
  grant(kOperatorAccount, tranche::schema::role_id_t::vault_operator);
  for (const auto& account : {kAliceAccount, kBobAccount}) {
    ASSERT_EQ(fixture
                  .submit(admin, tranche::schema::issue_asset_t{
                                     .asset_id = kAssetId,
                                     .to = account,
                                     .amount = make_units(1000)})
                  .code,
              0u);
  }
  vault.vault_id = kVaultId;
  vault.asset_id = kAssetId;
  ASSERT_EQ(fixture.submit(admin, vault).code, 0u);
}

amount_t shares_of(execution_fixture& fixture,
                   const tranche::schema::account_id_t& account) {
  return query_value<amount_t>(fixture.engine(), "/state/vault/balance",
                               std::tuple{kVaultId, account});
}

amount_t assets_of(execution_fixture& fixture,
                   const tranche::schema::account_id_t& account) {
  return query_value<amount_t>(fixture.engine(), "/state/asset/balance",
                               std::tuple{kAssetId, account});
}

amount_t vault_custody(execution_fixture& fixture) {
  return assets_of(fixture,
                   tranche::vault::make_vault_custody_account(kVaultId));
}

void deposit(execution_fixture& fixture,
             const tranche::schema::signer_id_t& signer,
             const tranche::schema::account_id_t& account,
             const amount_t& assets) {
  auto deposited = fixture.submit(
      signer, tranche::schema::deposit_t{
                  .vault_id = kVaultId, .assets = assets, .receiver = account});
  ASSERT_EQ(deposited.code, 0u) << deposited.info;
}

tranche::schema::signed_withdrawal_t sign_withdrawal(
    execution_fixture& fixture,
    const uint64_t nonce,
    const amount_t& shares,
    const amount_t& min_assets) {
  auto withdrawal = tranche::schema::signed_withdrawal_t{};
  withdrawal.request.owner = kAliceAccount;
  withdrawal.request.to = kAliceAccount;
  withdrawal.request.shares = shares;
  withdrawal.request.min_assets = min_assets;
  withdrawal.request.nonce = nonce;
  withdrawal.request.expiration = fixture.block_time() + 3600;
  withdrawal.signer = kAlice;
  withdrawal.signature =
      tranche::schema::signature_t{tranche::schema::ed25519_signature_t{}};
  return withdrawal;
}

}  // namespace

TEST(engine_vault_flow, deposit_transfer_and_redeem) {
  auto fixture = execution_fixture{"tranche_flow_plain"};
  bootstrap(fixture, tranche::schema::create_vault_t{});

  auto deposited = fixture.submit(
      kAlice, tranche::schema::deposit_t{.vault_id = kVaultId,
                                         .assets = make_units(100),
                                         .receiver = kAliceAccount});
  ASSERT_EQ(deposited.code, 0u) << deposited.info;
  EXPECT_FALSE(deposited.data.empty());
  EXPECT_TRUE(has_event(deposited, "vault_deposit"));
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(100));
  EXPECT_EQ(assets_of(fixture, kAliceAccount), make_units(900));

  ASSERT_EQ(fixture
                .submit(kAlice, tranche::schema::transfer_shares_t{
                                    .vault_id = kVaultId,
                                    .to = kBobAccount,
                                    .shares = make_units(40)})
                .code,
            0u);
  EXPECT_EQ(shares_of(fixture, kBobAccount), make_units(40));

  auto redeemed = fixture.submit(
      kBob, tranche::schema::redeem_t{.vault_id = kVaultId,
                                      .shares = make_units(40),
                                      .receiver = kBobAccount,
                                      .owner = kBobAccount});
  ASSERT_EQ(redeemed.code, 0u) << redeemed.info;
  EXPECT_EQ(shares_of(fixture, kBobAccount), 0);
  EXPECT_EQ(assets_of(fixture, kBobAccount), make_units(1040));

  auto vault = query_value<tranche::schema::vault_state_t>(
      fixture.engine(), "/state/vault", kVaultId);
  EXPECT_EQ(vault.total_supply, make_units(60));
  EXPECT_TRUE(fixture.engine().replay_history().ok);
}

TEST(engine_vault_flow, allow_list_hook_gates_deposits) {
  auto fixture = execution_fixture{"tranche_flow_hooks"};
  bootstrap(fixture, tranche::schema::create_vault_t{});

  auto config = tranche::schema::allow_list_hook_config_t{};
  config.accounts = {kAliceAccount};
  ASSERT_EQ(fixture
                .submit(kManager, tranche::schema::register_hook_t{
                                      .hook_id = kHookId, .config = config})
                .code,
            0u);
  auto added = fixture.submit(
      kManager, tranche::schema::add_hook_t{.vault_id = kVaultId,
                                            .tag = operation_tag_t::deposit,
                                            .hook_id = kHookId});
  ASSERT_EQ(added.code, 0u);
  EXPECT_TRUE(has_event(added, "hook_added"));

  auto denied = fixture.submit(
      kBob, tranche::schema::deposit_t{.vault_id = kVaultId,
                                       .assets = make_units(1),
                                       .receiver = kBobAccount});
  EXPECT_EQ(denied.code, code_of(transaction_error_code::hook_check_failed));
  EXPECT_NE(denied.info.find("not allowed"), std::string::npos);

  ASSERT_EQ(fixture
                .submit(kManager, tranche::schema::update_allow_list_t{
                                      .hook_id = kHookId,
                                      .account = kBobAccount,
                                      .listed = true})
                .code,
            0u);
  EXPECT_EQ(fixture
                .submit(kBob, tranche::schema::deposit_t{
                                  .vault_id = kVaultId,
                                  .assets = make_units(1),
                                  .receiver = kBobAccount})
                .code,
            0u);

  // The hook now backs a deposit, so it can no longer be removed.
  auto removal = fixture.submit(
      kManager, tranche::schema::remove_hook_t{.vault_id = kVaultId,
                                               .tag = operation_tag_t::deposit,
                                               .index = 0});
  EXPECT_EQ(removal.code, code_of(transaction_error_code::hook_removal_blocked));

  auto hooks = query_value<
      std::tuple<std::vector<tranche::schema::hook_entry_t>, uint64_t>>(
      fixture.engine(), "/state/vault/hooks",
      std::tuple{kVaultId, operation_tag_t::deposit});
  ASSERT_EQ(std::get<0>(hooks).size(), 1u);
  EXPECT_EQ(std::get<0>(hooks)[0].hook_id, kHookId);
  EXPECT_GE(std::get<1>(hooks), std::get<0>(hooks)[0].registered_at);
}

TEST(engine_vault_flow, gated_deposit_escrow_lifecycle) {
  auto fixture = execution_fixture{"tranche_flow_escrow"};
  bootstrap(fixture,
            tranche::schema::create_vault_t{.gated_deposits = true,
                                            .deposit_expiration_seconds = 600});

  auto requested = fixture.submit(
      kAlice, tranche::schema::deposit_t{.vault_id = kVaultId,
                                         .assets = make_units(10),
                                         .receiver = kAliceAccount});
  ASSERT_EQ(requested.code, 0u) << requested.info;
  auto deposit_id = fixture.encoder().decode<hash32_t>(
      tranche::schema::bytes_view_t{requested.data});
  EXPECT_TRUE(has_event(requested, "deposit_pending"));

  auto pending = query_value<tranche::schema::pending_deposit_t>(
      fixture.engine(), "/state/escrow/deposit", std::tuple{kVaultId, deposit_id});
  EXPECT_EQ(pending.status, tranche::schema::deposit_status_t::pending);
  EXPECT_EQ(pending.amount, make_units(10));

  auto ledger = query_value<
      std::tuple<amount_t, uint64_t, std::vector<account_amount_t>>>(
      fixture.engine(), "/state/escrow/ledger", kVaultId);
  EXPECT_EQ(std::get<0>(ledger), make_units(10));
  EXPECT_EQ(std::get<1>(ledger), 0u);

  EXPECT_EQ(fixture
                .submit(kAlice, tranche::schema::accept_deposit_t{
                                    .vault_id = kVaultId,
                                    .deposit_id = deposit_id})
                .code,
            code_of(transaction_error_code::unauthorized));

  auto accepted = fixture.submit(
      kOperator, tranche::schema::accept_deposit_t{.vault_id = kVaultId,
                                                   .deposit_id = deposit_id});
  ASSERT_EQ(accepted.code, 0u) << accepted.info;
  EXPECT_TRUE(has_event(accepted, "deposit_accepted"));
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(10));

  ledger = query_value<
      std::tuple<amount_t, uint64_t, std::vector<account_amount_t>>>(
      fixture.engine(), "/state/escrow/ledger", kVaultId);
  EXPECT_EQ(std::get<0>(ledger), 0);
  EXPECT_EQ(std::get<1>(ledger), 1u);

  // An expired request can be taken back by its depositor.
  auto second = fixture.submit(
      kBob, tranche::schema::deposit_t{.vault_id = kVaultId,
                                       .assets = make_units(5),
                                       .receiver = kBobAccount});
  ASSERT_EQ(second.code, 0u);
  auto second_id = fixture.encoder().decode<hash32_t>(
      tranche::schema::bytes_view_t{second.data});
  fixture.advance(600);
  auto reclaimed = fixture.submit(
      kBob, tranche::schema::reclaim_deposit_t{.vault_id = kVaultId,
                                               .deposit_id = second_id});
  ASSERT_EQ(reclaimed.code, 0u) << reclaimed.info;
  EXPECT_EQ(assets_of(fixture, kBobAccount), make_units(1000));
  EXPECT_TRUE(fixture.engine().replay_history().ok);
}

TEST(engine_vault_flow, oracle_prices_the_vault) {
  auto fixture = execution_fixture{"tranche_flow_oracle"};
  auto admin = execution_fixture::admin();
  ASSERT_EQ(fixture
                .submit(admin, tranche::schema::create_oracle_t{
                                   .oracle_id = kOracleId,
                                   .initial_price = make_units(1),
                                   .max_deviation_bps = 1000,
                                   .period_seconds = 60})
                .code,
            0u);
  EXPECT_EQ(fixture
                .submit(admin, tranche::schema::create_oracle_t{
                                   .oracle_id = kOracleId,
                                   .initial_price = make_units(1),
                                   .max_deviation_bps = 1000,
                                   .period_seconds = 60})
                .code,
            code_of(transaction_error_code::oracle_exists));
  bootstrap(fixture, tranche::schema::create_vault_t{.oracle_id = kOracleId});

  ASSERT_EQ(fixture
                .submit(kAlice, tranche::schema::deposit_t{
                                    .vault_id = kVaultId,
                                    .assets = 100,
                                    .receiver = kAliceAccount})
                .code,
            0u);
  EXPECT_EQ(shares_of(fixture, kAliceAccount), 100);

  // 5% is inside the per-period budget and applies at once.
  auto updated = fixture.submit(
      admin, tranche::schema::update_price_t{.oracle_id = kOracleId,
                                             .price = amount_t{
                                                 1'050'000'000'000'000'000ULL},
                                             .source = "desk"});
  ASSERT_EQ(updated.code, 0u) << updated.info;
  EXPECT_TRUE(has_event(updated, "oracle_price_updated"));

  auto price = query_value<std::tuple<amount_t, uint64_t>>(
      fixture.engine(), "/state/oracle/price", kOracleId);
  EXPECT_EQ(std::get<0>(price), amount_t{1'050'000'000'000'000'000ULL});
  EXPECT_EQ(std::get<1>(price), 10000u);

  // 100 shares are now worth 105 assets.
  ASSERT_EQ(fixture
                .submit(kBob, tranche::schema::deposit_t{
                                  .vault_id = kVaultId,
                                  .assets = 105,
                                  .receiver = kBobAccount})
                .code,
            0u);
  EXPECT_EQ(shares_of(fixture, kBobAccount), 100);

  EXPECT_EQ(fixture
                .submit(kBob, tranche::schema::update_price_t{
                                  .oracle_id = kOracleId,
                                  .price = make_units(2),
                                  .source = "desk"})
                .code,
            code_of(transaction_error_code::unauthorized));

  auto oracle_key = fixture.encoder().encode(kOracleId);
  auto report = fixture.engine().query(
      "/state/oracle/report",
      tranche::schema::bytes_view_t{oracle_key.data(), oracle_key.size()});
  ASSERT_EQ(report.code, 0u);
  auto reported = tranche::schema::decode_uint256(
      tranche::schema::bytes_view_t{report.value.data(), report.value.size()});
  ASSERT_TRUE(reported.has_value());
  EXPECT_EQ(*reported, amount_t{1'050'000'000'000'000'000ULL});
}

TEST(engine_vault_flow, managed_vault_runs_signed_withdrawals) {
  auto fixture = execution_fixture{"tranche_flow_signed"};
  bootstrap(fixture,
            tranche::schema::create_vault_t{.managed_withdrawals = true});
  ASSERT_EQ(fixture
                .submit(kAlice, tranche::schema::deposit_t{
                                    .vault_id = kVaultId,
                                    .assets = make_units(50),
                                    .receiver = kAliceAccount})
                .code,
            0u);

  // Owners cannot redeem on their own.
  EXPECT_EQ(fixture
                .submit(kAlice, tranche::schema::redeem_t{
                                    .vault_id = kVaultId,
                                    .shares = make_units(1),
                                    .receiver = kAliceAccount,
                                    .owner = kAliceAccount})
                .code,
            code_of(transaction_error_code::unauthorized));

  auto request = tranche::schema::withdrawal_request_t{};
  request.owner = kAliceAccount;
  request.to = kAliceAccount;
  request.shares = make_units(20);
  request.nonce = 42;
  request.expiration = fixture.block_time() + 3600;
  auto withdrawal = tranche::schema::signed_withdrawal_t{};
  withdrawal.request = request;
  withdrawal.signer = kAlice;
  withdrawal.signature =
      tranche::schema::signature_t{tranche::schema::ed25519_signature_t{}};

  auto executed = fixture.submit(
      kOperator, tranche::schema::execute_signed_withdrawals_t{
                     .vault_id = kVaultId, .withdrawals = {withdrawal}});
  ASSERT_EQ(executed.code, 0u) << executed.info;
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(30));
  EXPECT_EQ(assets_of(fixture, kAliceAccount), make_units(970));
  EXPECT_TRUE(query_value<bool>(fixture.engine(), "/state/withdrawal/nonce",
                                std::tuple{kVaultId, kAliceAccount, uint64_t{42}}));

  auto replayed = fixture.submit(
      kOperator, tranche::schema::execute_signed_withdrawals_t{
                     .vault_id = kVaultId, .withdrawals = {withdrawal}});
  EXPECT_EQ(replayed.code, code_of(transaction_error_code::withdraw_nonce_reuse));
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(30));
}

TEST(engine_vault_flow, failed_signed_withdrawal_batch_keeps_nothing) {
  auto fixture = execution_fixture{"tranche_flow_signed_batch"};
  bootstrap(fixture,
            tranche::schema::create_vault_t{.managed_withdrawals = true});
  deposit(fixture, kAlice, kAliceAccount, make_units(50));

  auto first = sign_withdrawal(fixture, 1, make_units(20), 0);
  auto floored = sign_withdrawal(fixture, 2, make_units(10), make_units(11));
  auto failed = fixture.submit(
      kOperator, tranche::schema::execute_signed_withdrawals_t{
                     .vault_id = kVaultId, .withdrawals = {first, floored}});
  EXPECT_EQ(failed.code,
            code_of(transaction_error_code::insufficient_output_assets));
  EXPECT_FALSE(query_value<bool>(fixture.engine(), "/state/withdrawal/nonce",
                                 std::tuple{kVaultId, kAliceAccount, uint64_t{1}}));
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(50));
  EXPECT_EQ(assets_of(fixture, kAliceAccount), make_units(950));
  EXPECT_EQ(vault_custody(fixture), make_units(50));

  auto retried = fixture.submit(
      kOperator, tranche::schema::execute_signed_withdrawals_t{
                     .vault_id = kVaultId, .withdrawals = {first}});
  ASSERT_EQ(retried.code, 0u) << retried.info;
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(30));
}

TEST(engine_vault_flow, failed_batch_redeem_keeps_nothing) {
  auto fixture = execution_fixture{"tranche_flow_batch_redeem"};
  bootstrap(fixture,
            tranche::schema::create_vault_t{.managed_withdrawals = true});
  deposit(fixture, kAlice, kAliceAccount, make_units(50));
  deposit(fixture, kBob, kBobAccount, make_units(10));

  auto failed = fixture.submit(
      kOperator,
      tranche::schema::batch_redeem_t{
          .vault_id = kVaultId,
          .shares = {make_units(20), make_units(20)},
          .receivers = {kAliceAccount, kBobAccount},
          .owners = {kAliceAccount, kBobAccount},
          .min_assets = {0, 0}});
  EXPECT_EQ(failed.code, code_of(transaction_error_code::exceeds_max_redeem));
  EXPECT_EQ(shares_of(fixture, kAliceAccount), make_units(50));
  EXPECT_EQ(shares_of(fixture, kBobAccount), make_units(10));
  EXPECT_EQ(assets_of(fixture, kAliceAccount), make_units(950));
  EXPECT_EQ(vault_custody(fixture), make_units(60));

  auto vault = query_value<tranche::schema::vault_state_t>(
      fixture.engine(), "/state/vault", kVaultId);
  EXPECT_EQ(vault.total_supply, make_units(60));
}

TEST(engine_vault_flow, failed_batch_accept_keeps_nothing) {
  auto fixture = execution_fixture{"tranche_flow_batch_accept"};
  bootstrap(fixture,
            tranche::schema::create_vault_t{.gated_deposits = true,
                                            .deposit_expiration_seconds = 600});

  auto request = [&](const auto& signer, const auto& account,
                     const amount_t& assets) {
    auto requested = fixture.submit(
        signer, tranche::schema::deposit_t{
                    .vault_id = kVaultId, .assets = assets, .receiver = account});
    EXPECT_EQ(requested.code, 0u) << requested.info;
    return fixture.encoder().decode<hash32_t>(
        tranche::schema::bytes_view_t{requested.data});
  };
  auto alice_id = request(kAlice, kAliceAccount, make_units(10));
  auto bob_id = request(kBob, kBobAccount, make_units(5));

  // Minting to bob is refused, so the second acceptance fails mid batch.
  auto config = tranche::schema::allow_list_hook_config_t{};
  config.accounts = {kBobAccount};
  config.deny_listed = true;
  ASSERT_EQ(fixture
                .submit(kManager, tranche::schema::register_hook_t{
                                      .hook_id = kHookId, .config = config})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(kManager, tranche::schema::add_hook_t{
                                      .vault_id = kVaultId,
                                      .tag = operation_tag_t::transfer,
                                      .hook_id = kHookId})
                .code,
            0u);

  auto failed = fixture.submit(
      kOperator, tranche::schema::batch_accept_deposits_t{
                     .vault_id = kVaultId, .deposit_ids = {alice_id, bob_id}});
  EXPECT_EQ(failed.code, code_of(transaction_error_code::hook_check_failed));
  EXPECT_NE(failed.info.find("denied"), std::string::npos);

  EXPECT_EQ(shares_of(fixture, kAliceAccount), 0);
  EXPECT_EQ(vault_custody(fixture), 0);
  auto pending = query_value<tranche::schema::pending_deposit_t>(
      fixture.engine(), "/state/escrow/deposit", std::tuple{kVaultId, alice_id});
  EXPECT_EQ(pending.status, tranche::schema::deposit_status_t::pending);
  auto ledger = query_value<
      std::tuple<amount_t, uint64_t, std::vector<account_amount_t>>>(
      fixture.engine(), "/state/escrow/ledger", kVaultId);
  EXPECT_EQ(std::get<0>(ledger), make_units(15));
  EXPECT_EQ(std::get<1>(ledger), 0u);
}
