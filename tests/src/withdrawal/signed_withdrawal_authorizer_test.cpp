#include <tranche/crypto/verify.hpp>
#include <tranche/testing/signing.hpp>
#include <tranche/testing/vault_fixture.hpp>
#include <tranche/withdrawal/signed_withdrawal_authorizer.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

using tranche::schema::amount_t;
using tranche::schema::signed_withdrawal_t;
using tranche::schema::transaction_error_code;
using tranche::schema::withdrawal_request_t;
using tranche::testing::make_hash;
using tranche::testing::make_named_account;
using tranche::testing::make_named_signer;
using tranche::testing::vault_fixture;
using tranche::testing::vault_options;
using tranche::withdrawal::signed_withdrawal_authorizer;

const auto kChainId = make_hash(0xC1);
const auto kOwner = make_named_account(0x11);
const auto& kBob = vault_fixture::kBob;
const auto& kOperator = vault_fixture::kOperator;

class withdrawal_harness final {
 public:
  explicit withdrawal_harness(const bool managed = true)
      : fixture_{vault_options{.managed_withdrawals = managed}} {
    nonces_.vault_id = vault_fixture::kVaultId;
  }

  /// Verifier that answers with `accept_signatures`.
  signed_withdrawal_authorizer authorizer() {
    return signed_withdrawal_authorizer{
        nonces_, fixture_.vault(), kChainId,
        [this](const auto&, const auto&, const auto&) {
          return accept_signatures;
        }};
  }

  signed_withdrawal_authorizer verifying_authorizer() {
    return signed_withdrawal_authorizer{nonces_, fixture_.vault(), kChainId,
                                        tranche::crypto::verify_signature};
  }

  void seed_shares(const tranche::schema::account_id_t& owner,
                   const amount_t& assets) {
    fixture_.fund(owner, assets);
    auto deposited =
        fixture_.vault().deposit(fixture_.as(owner), assets, owner);
    ASSERT_TRUE(deposited.ok()) << deposited.reason;
  }

  withdrawal_request_t request(const uint64_t nonce,
                               const amount_t& shares,
                               const tranche::schema::account_id_t& owner =
                                   kOwner) const {
    auto request = withdrawal_request_t{};
    request.owner = owner;
    request.to = kBob;
    request.shares = shares;
    request.nonce = nonce;
    request.expiration = fixture_.now() + 100;
    return request;
  }

  vault_fixture& fixture() { return fixture_; }
  const tranche::schema::withdrawal_nonce_state_t& nonces() const {
    return nonces_;
  }

  bool accept_signatures{true};

 private:
  vault_fixture fixture_;
  tranche::schema::withdrawal_nonce_state_t nonces_;
};

signed_withdrawal_t sign_as(const tranche::schema::signer_id_t& signer,
                            const withdrawal_request_t& request) {
  auto withdrawal = signed_withdrawal_t{};
  withdrawal.request = request;
  withdrawal.signer = signer;
  withdrawal.signature =
      tranche::schema::signature_t{tranche::schema::ed25519_signature_t{}};
  return withdrawal;
}

signed_withdrawal_t sign_named(const withdrawal_request_t& request) {
  return sign_as(make_named_signer(0x11), request);
}

}  // namespace

TEST(signed_withdrawal_authorizer, executes_and_burns_the_nonce) {
  auto harness = withdrawal_harness{};
  harness.seed_shares(kOwner, 1000);
  auto authorizer = harness.authorizer();
  auto& fixture = harness.fixture();

  auto released = authorizer.execute(fixture.as(kOperator),
                                     {sign_named(harness.request(7, 400))});
  ASSERT_TRUE(released.ok()) << released.reason;
  EXPECT_EQ(released.value, 400);
  EXPECT_EQ(fixture.vault().balance_of(kOwner), 600);
  EXPECT_EQ(fixture.assets_of(kBob), 400);
  EXPECT_TRUE(authorizer.is_nonce_used(kOwner, 7));
  EXPECT_FALSE(authorizer.is_nonce_used(kOwner, 8));
  EXPECT_EQ(fixture.events().back().type, "signed_withdrawal_executed");

  EXPECT_EQ(authorizer
                .execute(fixture.as(kOperator),
                         {sign_named(harness.request(7, 100))})
                .code,
            transaction_error_code::withdraw_nonce_reuse);
  EXPECT_EQ(fixture.vault().balance_of(kOwner), 600);
}

TEST(signed_withdrawal_authorizer, batch_sums_released_assets) {
  auto harness = withdrawal_harness{};
  harness.seed_shares(kOwner, 1000);
  auto authorizer = harness.authorizer();

  auto released = authorizer.execute(
      harness.fixture().as(kOperator),
      {sign_named(harness.request(1, 100)), sign_named(harness.request(2, 250))});
  ASSERT_TRUE(released.ok()) << released.reason;
  EXPECT_EQ(released.value, 350);
  EXPECT_EQ(harness.nonces().used.size(), 2u);
}

TEST(signed_withdrawal_authorizer, rejects_expired_requests) {
  auto harness = withdrawal_harness{};
  harness.seed_shares(kOwner, 1000);
  auto authorizer = harness.authorizer();
  auto request = harness.request(3, 100);

  harness.fixture().advance(100);
  ASSERT_TRUE(authorizer
                  .execute(harness.fixture().as(kOperator), {sign_named(request)})
                  .ok());

  request.nonce = 4;
  harness.fixture().advance(1);
  EXPECT_EQ(authorizer
                .execute(harness.fixture().as(kOperator), {sign_named(request)})
                .code,
            transaction_error_code::withdrawal_request_expired);
  EXPECT_FALSE(authorizer.is_nonce_used(kOwner, 4));
}

TEST(signed_withdrawal_authorizer, rejects_signatures_that_do_not_authorize) {
  auto harness = withdrawal_harness{};
  harness.seed_shares(kOwner, 1000);
  auto authorizer = harness.authorizer();
  auto& fixture = harness.fixture();

  auto foreign = sign_as(make_named_signer(0x12), harness.request(5, 100));
  EXPECT_EQ(authorizer.execute(fixture.as(kOperator), {foreign}).code,
            transaction_error_code::withdraw_invalid_signature);

  harness.accept_signatures = false;
  EXPECT_EQ(authorizer
                .execute(fixture.as(kOperator), {sign_named(harness.request(5, 100))})
                .code,
            transaction_error_code::withdraw_invalid_signature);
  EXPECT_FALSE(authorizer.is_nonce_used(kOwner, 5));
  EXPECT_EQ(fixture.vault().balance_of(kOwner), 1000);
}

TEST(signed_withdrawal_authorizer, applies_the_owner_floor) {
  auto harness = withdrawal_harness{};
  harness.seed_shares(kOwner, 1000);
  auto authorizer = harness.authorizer();

  auto request = harness.request(6, 400);
  request.min_assets = 401;
  EXPECT_EQ(authorizer
                .execute(harness.fixture().as(kOperator), {sign_named(request)})
                .code,
            transaction_error_code::insufficient_output_assets);
  EXPECT_FALSE(authorizer.is_nonce_used(kOwner, 6));
  EXPECT_EQ(harness.fixture().vault().balance_of(kOwner), 1000);

  request.min_assets = 400;
  EXPECT_TRUE(authorizer
                  .execute(harness.fixture().as(kOperator), {sign_named(request)})
                  .ok());
  EXPECT_TRUE(authorizer.is_nonce_used(kOwner, 6));
}

TEST(signed_withdrawal_authorizer, requires_operator_and_managed_vault) {
  auto harness = withdrawal_harness{};
  harness.seed_shares(kOwner, 1000);
  auto authorizer = harness.authorizer();
  auto& fixture = harness.fixture();

  EXPECT_EQ(authorizer
                .execute(fixture.as(kOwner), {sign_named(harness.request(1, 10))})
                .code,
            transaction_error_code::unauthorized);
  EXPECT_EQ(authorizer.execute(fixture.as(kOperator), {}).code,
            transaction_error_code::invalid_array_lengths);

  auto open = withdrawal_harness{false};
  open.seed_shares(kOwner, 1000);
  EXPECT_EQ(open.authorizer()
                .execute(open.fixture().as(kOperator),
                         {sign_named(open.request(1, 10))})
                .code,
            transaction_error_code::operation_disabled);
}

TEST(signed_withdrawal_authorizer, digest_binds_chain_and_vault) {
  auto harness = withdrawal_harness{};
  auto request = harness.request(1, 10);
  auto digest = tranche::withdrawal::make_withdrawal_digest(
      kChainId, vault_fixture::kVaultId, request);
  EXPECT_NE(digest, tranche::withdrawal::make_withdrawal_digest(
                        make_hash(0xC2), vault_fixture::kVaultId, request));
  EXPECT_NE(digest, tranche::withdrawal::make_withdrawal_digest(
                        kChainId, make_hash(0x41), request));
  request.nonce = 2;
  EXPECT_NE(digest, tranche::withdrawal::make_withdrawal_digest(
                        kChainId, vault_fixture::kVaultId, request));
}

TEST(signed_withdrawal_authorizer, accepts_ed25519_signed_requests) {
  if (!tranche::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = tranche::testing::ed25519_key::generate();
  ASSERT_TRUE(key.has_value());

  auto harness = withdrawal_harness{};
  harness.seed_shares(key->account(), 1000);
  auto authorizer = harness.verifying_authorizer();

  auto request = harness.request(9, 300, key->account());
  auto digest = tranche::withdrawal::make_withdrawal_digest(
      kChainId, vault_fixture::kVaultId, request);
  auto signature = key->sign(tranche::schema::bytes_view_t{digest});
  ASSERT_TRUE(signature.has_value());

  auto withdrawal = signed_withdrawal_t{};
  withdrawal.request = request;
  withdrawal.signer = key->signer();
  withdrawal.signature = *signature;
  auto released =
      authorizer.execute(harness.fixture().as(kOperator), {withdrawal});
  ASSERT_TRUE(released.ok()) << released.reason;
  EXPECT_EQ(released.value, 300);

  auto tampered = withdrawal;
  tampered.request.nonce = 10;
  EXPECT_EQ(authorizer.execute(harness.fixture().as(kOperator), {tampered}).code,
            transaction_error_code::withdraw_invalid_signature);
}
