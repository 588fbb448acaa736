#include <string>
#include <tranche/common/critical.hpp>
#include <tranche/storage/rocksdb/storage.hpp>
#include <tuple>

namespace tranche::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    tranche::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    tranche::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    tranche::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, tranche::schema::hash32_t>>(
          tranche::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    tranche::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tranche::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  for_each_with_prefix(prefix, [&](const auto& key, const auto& value) {
    entries.push_back(
        key_value_entry_t{detail::to_bytes(key), detail::to_bytes(value)});
  });
  return entries;
}

void storage<rocksdb_storage_tag>::apply(const commit_batch& batch) const {
  auto write_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto check = [](const ROCKSDB_NAMESPACE::Status& status,
                  const std::string_view what) {
    if (!status.ok()) {
      spdlog::error("RocksDB batch {} failed: {}", what, status.ToString());
      tranche::common::critical("failed to stage commit batch");
    }
  };

  auto stale = size_t{0};
  for_each_with_prefix(
      tranche::schema::bytes_view_t{batch.state_prefix},
      [&](const auto& key, const auto&) {
        check(write_batch.Delete(key), "delete");
        ++stale;
      });
  for (const auto& rows : {&batch.state_rows, &batch.appended_rows}) {
    for (const auto& [key, value] : *rows) {
      check(write_batch.Put(detail::to_slice(tranche::schema::bytes_view_t{key}),
                            detail::to_slice(tranche::schema::bytes_view_t{value})),
            "put");
    }
  }

  auto encoder = detail::encoder_t{};
  auto checkpoint = encoder.encode(
      std::tuple{batch.checkpoint.height, batch.checkpoint.state_root});
  check(write_batch.Put(std::string{detail::kCommittedHeightKey},
                        detail::to_slice(tranche::schema::bytes_view_t{checkpoint})),
        "checkpoint");

  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  auto status = database->Write(options, &write_batch);
  if (!status.ok()) {
    spdlog::error("RocksDB commit at height {} failed: {}",
                  batch.checkpoint.height, status.ToString());
    tranche::common::critical("failed to write commit batch");
  }
  spdlog::debug("Wrote height {}: {} state row(s) replacing {}, {} appended",
                batch.checkpoint.height, batch.state_rows.size(), stale,
                batch.appended_rows.size());
}

}  // namespace tranche::storage
