#include <tranche/schema/primitives.hpp>
#include <tranche/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

TEST(primitives, make_hash32_from_hex_accepts_prefix) {
  auto hash = tranche::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(tranche::schema::to_hex(*hash),
            "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_malformed_hex) {
  EXPECT_FALSE(tranche::schema::try_make_hash32("abc").has_value());
  EXPECT_FALSE(tranche::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(tranche::schema::try_make_hash32(
                   "zz02030405060708090a0b0c0d0e0f10"
                   "1112131415161718191a1b1c1d1e1f20")
                   .has_value());
}

TEST(primitives, zero_hash_is_the_null_account) {
  EXPECT_TRUE(tranche::schema::is_null_account(tranche::schema::make_zero_hash()));
  EXPECT_FALSE(
      tranche::schema::is_null_account(tranche::testing::make_hash(0x01)));
}

TEST(primitives, named_signers_are_their_own_account) {
  auto named = tranche::testing::make_named_signer_id(0x42);
  EXPECT_EQ(tranche::schema::make_account_id(
                tranche::schema::signer_id_t{named}),
            named);
}

TEST(primitives, key_signers_derive_distinct_accounts) {
  auto ed = tranche::testing::make_ed25519_signer(0x07);
  auto account = tranche::schema::make_account_id(ed);
  EXPECT_NE(account, tranche::schema::make_zero_hash());
  EXPECT_EQ(account, tranche::schema::make_account_id(ed));

  // Same leading key bytes under a different key type.
  auto secp = tranche::schema::secp256k1_signer_id{};
  std::copy(std::begin(ed.public_key), std::end(ed.public_key),
            std::begin(secp.public_key));
  EXPECT_NE(account, tranche::schema::make_account_id(secp));
}

TEST(primitives, uint256_encoding_is_big_endian) {
  auto encoded = tranche::schema::encode_uint256(0x0102);
  ASSERT_EQ(encoded.size(), 32u);
  EXPECT_EQ(encoded[30], 0x01);
  EXPECT_EQ(encoded[31], 0x02);

  auto price = tranche::testing::make_units(1234);
  auto decoded = tranche::schema::decode_uint256(
      tranche::schema::encode_uint256(price));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, price);

  auto truncated = tranche::schema::bytes_t(31, 0);
  EXPECT_FALSE(tranche::schema::decode_uint256(truncated).has_value());
}
