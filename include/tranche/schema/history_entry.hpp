#pragma once

#include <tranche/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Ordered transaction bytes plus execution code and block time, enough to
// replay the ledger from genesis.
namespace tranche::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  uint32_t code{};
  timestamp_seconds_t block_time{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace tranche::schema
