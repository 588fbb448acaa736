#pragma once

#include <gtest/gtest.h>

#include <tranche/execution/engine.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/schema/transaction.hpp>
#include <tranche/testing/common.hpp>

#include <cstdint>
#include <string_view>
#include <tuple>
#include <vector>

namespace tranche::testing {

using scale_encoder_t = tranche::schema::encoding::encoder<
    tranche::schema::encoding::scale_encoder_tag>;

inline tranche::schema::transaction_t make_transaction(
    const tranche::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const tranche::schema::signer_id_t& signer,
    const tranche::schema::transaction_payload_t& payload) {
  return tranche::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = tranche::schema::ed25519_signature_t{}};
}

inline tranche::schema::bytes_t encode_transaction(
    const tranche::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

/// Finalize and commit a block holding only `tx`.
inline tranche::schema::transaction_result_t finalize_single(
    tranche::execution::engine& engine,
    const uint64_t height,
    const tranche::schema::timestamp_seconds_t block_time,
    const tranche::schema::transaction_t& tx) {
  auto block =
      engine.finalize_block(height, block_time, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  static_cast<void>(engine.commit());
  return result;
}

/// Run `path` with raw key bytes and decode the value as `T`.
template <typename T>
T query_raw(tranche::execution::engine& engine,
            const std::string_view path,
            const tranche::schema::bytes_view_t& key) {
  const auto result = engine.query(path, key);
  EXPECT_EQ(result.code, 0u) << path << ": " << result.log;
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(
      tranche::schema::bytes_view_t{result.value.data(), result.value.size()});
}

/// Run `path` with a SCALE encoded key and decode the value as `T`.
template <typename T, typename Key>
T query_value(tranche::execution::engine& engine,
              const std::string_view path,
              const Key& key) {
  auto encoder = scale_encoder_t{};
  const auto encoded_key = encoder.encode(key);
  return query_raw<T>(
      engine, path,
      tranche::schema::bytes_view_t{encoded_key.data(), encoded_key.size()});
}

/// Chain id reported by `/engine/info` (height, state root, chain id).
inline tranche::schema::hash32_t chain_id_from_engine(
    tranche::execution::engine& engine) {
  return std::get<2>(
      query_raw<std::tuple<int64_t, tranche::schema::hash32_t,
                           tranche::schema::hash32_t>>(engine, "/engine/info",
                                                       {}));
}

}  // namespace tranche::testing
