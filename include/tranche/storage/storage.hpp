#pragma once
#include <tranche/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace tranche::storage {

using key_value_entry_t =
    std::pair<tranche::schema::bytes_t, tranche::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  tranche::schema::hash32_t state_root;
};

/// Everything a block commit writes. Backends apply it as one atomic batch so
/// state rows, history rows and the checkpoint never disagree after a crash.
struct commit_batch final {
  /// Every row under this prefix is dropped and `state_rows` written instead.
  tranche::schema::bytes_t state_prefix;
  std::vector<key_value_entry_t> state_rows;
  /// Rows written next to the existing ones (history).
  std::vector<key_value_entry_t> appended_rows;
  committed_state checkpoint{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tranche::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tranche::schema::bytes_view_t& key,
           const T& value);

  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tranche::schema::bytes_view_t& prefix) const;

  void apply(const commit_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tranche::storage
