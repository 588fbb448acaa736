#pragma once
#include <tranche/common/critical.hpp>
#include <tranche/schema/encoding/encoder.hpp>
#include <algorithm>
#include <iterator>
#include <utility>
#include <scale/scale.hpp>

namespace tranche::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec. Schema records are plain aggregates and are encoded field by
/// field in declaration order; variants carry a one byte index.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tranche::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tranche::schema::bytes_t& out);

  template <typename T>
  T decode(const tranche::schema::bytes_view_t& bytes);

  /// Decode for untrusted input (transactions, query keys). Only the
  /// canonical encoding of a value is accepted: trailing bytes or any other
  /// byte string that does not re-encode to itself yields std::nullopt.
  template <typename T>
  std::optional<T> try_decode(const tranche::schema::bytes_view_t& bytes);
};

template <typename T>
tranche::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    tranche::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        tranche::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const tranche::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    tranche::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tranche::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto reencoded = ::scale::impl::memory::encode(decoded.value());
  if (!reencoded || !std::equal(std::begin(bytes), std::end(bytes),
                                std::begin(reencoded.value()),
                                std::end(reencoded.value()))) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace tranche::schema::encoding
