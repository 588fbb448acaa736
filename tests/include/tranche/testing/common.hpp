#pragma once

#include <tranche/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <numeric>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace tranche::testing {

/// Hash whose bytes count up from `seed`. Distinct seeds give distinct ids.
inline tranche::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tranche::schema::hash32_t{};
  std::iota(std::begin(out), std::end(out), seed);
  return out;
}

inline tranche::schema::named_signer_t make_named_signer_id(
    const uint8_t seed) {
  auto named = tranche::schema::named_signer_t{};
  named.front() = seed;
  return named;
}

inline tranche::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return tranche::schema::signer_id_t{make_named_signer_id(seed)};
}

/// Account a named signer acts as.
inline tranche::schema::account_id_t make_named_account(const uint8_t seed) {
  return tranche::schema::make_account_id(make_named_signer(seed));
}

inline tranche::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = tranche::schema::ed25519_signer_id{};
  std::iota(std::begin(signer.public_key), std::end(signer.public_key), seed);
  return signer;
}

/// Whole units with 18 decimals.
inline tranche::schema::amount_t make_units(const uint64_t whole) {
  return tranche::schema::amount_t{whole} *
         tranche::schema::amount_t{1'000'000'000'000'000'000ULL};
}

/// Database directory under the system temp dir, removed with everything in
/// it when the object goes away. Unique per process and per instance.
class scratch_directory final {
 public:
  explicit scratch_directory(const std::string_view prefix)
      : path_{(std::filesystem::temp_directory_path() /
               (std::string{prefix} + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(next_serial())))
                  .string()} {
    remove();
  }

  scratch_directory(const scratch_directory&) = delete;
  scratch_directory& operator=(const scratch_directory&) = delete;

  ~scratch_directory() { remove(); }

  const std::string& path() const { return path_; }

 private:
  static uint64_t next_serial() {
    static auto serial = std::atomic<uint64_t>{};
    return serial.fetch_add(1);
  }

  void remove() const {
    auto error = std::error_code{};
    std::filesystem::remove_all(path_, error);
  }

  std::string path_;
};

}  // namespace tranche::testing
