#pragma once

#include <tranche/execution/engine_config.hpp>
#include <tranche/execution/ledger_state.hpp>
#include <tranche/execution/signature_verifier.hpp>
#include <tranche/schema/app_info.hpp>
#include <tranche/schema/block_result.hpp>
#include <tranche/schema/commit_result.hpp>
#include <tranche/schema/encoding/encoder.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/schema/history_entry.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/query_result.hpp>
#include <tranche/schema/replay_result.hpp>
#include <tranche/schema/transaction.hpp>
#include <tranche/schema/transaction_result.hpp>
#include <tranche/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tranche::execution {

/// Deterministic share ledger state machine.
///
/// Blocks arrive already ordered. The engine validates transaction
/// envelopes, executes payloads against the vault, escrow, oracle and
/// withdrawal components, folds a state root, persists state and history on
/// commit, and serves read-only queries against committed state.
class engine final {
 public:
  /// Construct the engine over an opened storage backend.
  ///
  /// Loads committed state when present. Otherwise seeds genesis state from
  /// `config` (granting `genesis_admin` the admin role) and persists it at
  /// height 0.
  explicit engine(
      tranche::schema::encoding::encoder<
          tranche::schema::encoding::scale_encoder_tag>& encoder,
      tranche::storage::storage<tranche::storage::rocksdb_storage_tag>& storage,
      engine_config_t config);

  /// Admit a transaction for inclusion.
  ///
  /// Performs decode and envelope validation against committed state only;
  /// does not mutate application state.
  tranche::schema::transaction_result_t check_transaction(
      const tranche::schema::bytes_view_t& raw_tx);

  /// Execute a block and compute its resulting state_root.
  ///
  /// Transactions are processed in order, each one atomically; per-tx
  /// results are returned even on failures. A second call before `commit`
  /// replaces the previous pending block.
  tranche::schema::block_result_t finalize_block(
      uint64_t height,
      tranche::schema::timestamp_seconds_t block_time,
      const std::vector<tranche::schema::bytes_t>& txs);

  /// Commit the latest finalized block to durable storage.
  tranche::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  tranche::schema::app_info_t info() const;

  /// Execute a read-only query by route against committed state.
  tranche::schema::query_result_t query(
      std::string_view path,
      const tranche::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<tranche::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Re-run persisted history from genesis and check that the state root and
  /// every recorded result code agree. Committed state is left untouched.
  tranche::schema::replay_result_t replay_history();

  /// Install the signature verification callback used for envelopes and
  /// signed withdrawal requests.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Validate envelope version, chain id, nonce and signature against
  /// `state`. Returns a zero-code result when the envelope is admissible.
  tranche::schema::transaction_result_t validate_transaction(
      const ledger_state& state,
      const tranche::schema::transaction_t& tx,
      std::string_view codespace) const;

  /// Validate and execute one raw transaction against `state`. `state` is
  /// only replaced on success.
  tranche::schema::transaction_result_t execute_transaction(
      ledger_state& state,
      tranche::schema::timestamp_seconds_t block_time,
      const tranche::schema::bytes_t& raw_tx) const;

  ledger_state make_genesis_state() const;
  /// Load committed state rows from storage at startup.
  void load_persisted_state();
  /// Rows of `state`, the block's history and its checkpoint, ready to be
  /// written in one batch.
  tranche::storage::commit_batch make_commit_batch(
      const ledger_state& state,
      tranche::schema::timestamp_seconds_t block_time,
      const std::vector<tranche::schema::history_entry_t>& history,
      int64_t height,
      const tranche::schema::hash32_t& state_root) const;

  mutable std::mutex mutex_;
  tranche::schema::encoding::encoder<
      tranche::schema::encoding::scale_encoder_tag>& encoder_;
  tranche::storage::storage<tranche::storage::rocksdb_storage_tag>& storage_;
  engine_config_t config_;
  ledger_state committed_state_;
  tranche::schema::timestamp_seconds_t committed_block_time_{};
  int64_t last_committed_height_{};
  tranche::schema::hash32_t last_committed_state_root_{};
  std::optional<ledger_state> pending_state_;
  std::vector<tranche::schema::history_entry_t> pending_history_;
  int64_t pending_height_{};
  tranche::schema::timestamp_seconds_t pending_block_time_{};
  tranche::schema::hash32_t pending_state_root_{};
  signature_verifier_t signature_verifier_;
};

}  // namespace tranche::execution
