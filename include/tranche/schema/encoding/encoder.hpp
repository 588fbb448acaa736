#pragma once
#include <tranche/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tranche::schema::encoding {

// Codec selection is a build time setting: callers name the library tag,
// e.g. encoder<scale_encoder_tag>. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  tranche::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tranche::schema::bytes_t& out);

  template <typename T>
  T decode(const tranche::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tranche::schema::bytes_view_t& bytes);
};

}  // namespace tranche::schema::encoding
