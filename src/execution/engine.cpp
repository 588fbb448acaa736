#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>
#include <tranche/blake3/hash.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/crypto/verify.hpp>
#include <tranche/execution/authorization.hpp>
#include <tranche/execution/dispatcher.hpp>
#include <tranche/execution/engine.hpp>
#include <tranche/oracle/price_transition_oracle.hpp>
#include <tranche/schema/key/engine_keys.hpp>
#include <tuple>
#include <utility>

using namespace tranche::schema;

namespace {

using encoder_t = tranche::schema::encoding::encoder<
    tranche::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckCodespace = std::string_view{"tranche.checktx"};
constexpr auto kExecuteCodespace = std::string_view{"tranche.execute"};
constexpr auto kFinalizeCodespace = std::string_view{"tranche.finalize"};
constexpr auto kQueryCodespace = std::string_view{"tranche.query"};

tranche::schema::hash32_t fold_state_root(const tranche::schema::hash32_t& seed,
                                          const tranche::schema::bytes_t& tx,
                                          uint64_t height,
                                          uint64_t index) {
  auto material = tranche::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return tranche::blake3::hash(
      tranche::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<tranche::schema::transaction_t> decode_transaction(
    const tranche::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<tranche::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction bytes do not decode";
  }
  return tx;
}

tranche::schema::transaction_result_t make_error_result(
    const transaction_error_code code,
    std::string log,
    std::string info,
    const std::string_view codespace) {
  auto result = tranche::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

tranche::schema::query_result_t make_query_error(
    const query_error_code code,
    std::string log,
    const tranche::schema::bytes_view_t& key,
    const int64_t height) {
  auto result = tranche::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

/// Bytes covered by the envelope signature.
tranche::schema::bytes_t make_signing_payload(
    const tranche::schema::transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

bool signature_matches_signer(const tranche::schema::signer_id_t& signer,
                              const tranche::schema::signature_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id&) {
                   return std::holds_alternative<ed25519_signature_t>(signature);
                 },
                 [&](const secp256k1_signer_id&) {
                   return std::holds_alternative<secp256k1_signature_t>(
                       signature);
                 },
                 [](const named_signer_t&) { return false; }},
      signer);
}

template <typename T>
std::vector<T> decode_rows(encoder_t& encoder,
                           const std::vector<tranche::storage::key_value_entry_t>& rows) {
  auto values = std::vector<T>{};
  values.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    values.push_back(encoder.decode<T>(bytes_view_t{value}));
  }
  return values;
}

}  // namespace

namespace tranche::execution {

engine::engine(
    tranche::schema::encoding::encoder<
        tranche::schema::encoding::scale_encoder_tag>& encoder,
    tranche::storage::storage<tranche::storage::rocksdb_storage_tag>& storage,
    engine_config_t config)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      signature_verifier_{tranche::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine for chain {}",
               to_hex(config_.chain_id));
  if (!config_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; envelope signatures are not checked");
  }

  if (storage_.load_committed_state()) {
    load_persisted_state();
  } else {
    committed_state_ = make_genesis_state();
    last_committed_state_root_ = make_zero_hash();
    storage_.apply(make_commit_batch(committed_state_, committed_block_time_,
                                     {}, last_committed_height_,
                                     last_committed_state_root_));
  }
  spdlog::info("Execution engine ready at height {} with {} vault(s)",
               last_committed_height_, committed_state_.vaults.size());
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckCodespace);
  }
  return validate_transaction(committed_state_, *maybe_tx, kCheckCodespace);
}

transaction_result_t engine::validate_transaction(
    const ledger_state& state,
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != config_.chain_id) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "transaction targets another chain", codespace);
  }

  auto actor = make_account_id(tx.signer);
  auto nonce_it = state.signer_nonces.find(actor);
  auto expected =
      (nonce_it == std::end(state.signer_nonces) ? 0 : nonce_it->second) + 1;
  if (tx.nonce != expected) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected nonce " + std::to_string(expected),
                             codespace);
  }

  if (config_.require_strict_crypto) {
    if (!signature_matches_signer(tx.signer, tx.signature)) {
      return make_error_result(transaction_error_code::invalid_signature_type,
                               "invalid signature type",
                               "signature does not match the signer key type",
                               codespace);
    }
    auto message = make_signing_payload(tx);
    if (!signature_verifier_(bytes_view_t{message}, tx.signer, tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature verification failed", "", codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_transaction(
    ledger_state& state,
    const timestamp_seconds_t block_time,
    const bytes_t& raw_tx) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(bytes_view_t{raw_tx}, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kFinalizeCodespace);
  }
  auto validation = validate_transaction(state, *maybe_tx, kFinalizeCodespace);
  if (validation.code != 0) {
    return validation;
  }

  auto candidate = state;
  auto actor = make_account_id(maybe_tx->signer);
  candidate.signer_nonces[actor] = maybe_tx->nonce;
  candidate.sequence += 1;

  auto events = std::vector<transaction_event_t>{};
  auto request = dispatch_request{.actor = actor,
                                  .block_time = block_time,
                                  .sequence = candidate.sequence,
                                  .chain_id = config_.chain_id,
                                  .verifier = signature_verifier_};
  auto applied = apply_payload(candidate, request, maybe_tx->payload, events);
  if (!applied.ok()) {
    spdlog::warn("Transaction from {} rejected with code {}: {}", to_hex(actor),
                 static_cast<uint32_t>(applied.code), applied.reason);
    return make_error_result(applied.code, "transaction rejected",
                             applied.reason, kExecuteCodespace);
  }

  state = std::move(candidate);
  auto result = transaction_result_t{};
  result.data = std::move(applied.value);
  result.events = std::move(events);
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto working = committed_state_;
  auto history = std::vector<history_entry_t>{};
  history.reserve(txs.size());
  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto tx_result = execute_transaction(working, block_time, txs[i]);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    history.push_back(history_entry_t{.height = height,
                                      .index = static_cast<uint32_t>(i),
                                      .code = tx_result.code,
                                      .block_time = block_time,
                                      .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_state_ = std::move(working);
  pending_history_ = std::move(history);
  pending_height_ = static_cast<int64_t>(height);
  pending_block_time_ = block_time;
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_state_) {
    storage_.apply(make_commit_batch(*pending_state_, pending_block_time_,
                                     pending_history_, pending_height_,
                                     pending_state_root_));

    committed_state_ = std::move(*pending_state_);
    committed_block_time_ = pending_block_time_;
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_state_.reset();
    pending_history_.clear();
    pending_height_ = 0;
  }

  spdlog::info("Committed height {} state root {}", last_committed_height_,
               to_hex(last_committed_state_root_));

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};
  const auto& state = committed_state_;

  const auto invalid_key = [&] {
    spdlog::warn("Query {} with undecodable key", path);
    return make_query_error(query_error_code::invalid_key, "invalid key", data,
                            last_committed_height_);
  };
  const auto not_found = [&] {
    spdlog::warn("Query {} found nothing", path);
    return make_query_error(query_error_code::not_found, "not found", data,
                            last_committed_height_);
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, config_.chain_id});
    return result;
  }

  if (path == "/state/vault") {
    auto vault_id = encoder_.try_decode<hash32_t>(data);
    if (!vault_id) {
      return invalid_key();
    }
    auto it = state.vaults.find(*vault_id);
    if (it == std::end(state.vaults)) {
      return not_found();
    }
    result.value = encoder_.encode(it->second);
    return result;
  }

  if (path == "/state/vault/balance") {
    auto key = encoder_.try_decode<std::tuple<hash32_t, account_id_t>>(data);
    if (!key) {
      return invalid_key();
    }
    auto it = state.vaults.find(std::get<0>(*key));
    if (it == std::end(state.vaults)) {
      return not_found();
    }
    const auto& balances = it->second.balances;
    auto row = std::find_if(
        std::begin(balances), std::end(balances),
        [&](const auto& entry) { return entry.account == std::get<1>(*key); });
    result.value =
        encoder_.encode(row == std::end(balances) ? amount_t{0} : row->amount);
    return result;
  }

  if (path == "/state/vault/hooks") {
    auto key = encoder_.try_decode<std::tuple<hash32_t, operation_tag_t>>(data);
    if (!key) {
      return invalid_key();
    }
    auto it = state.vaults.find(std::get<0>(*key));
    if (it == std::end(state.vaults)) {
      return not_found();
    }
    const auto& hooks = it->second.hooks;
    switch (std::get<1>(*key)) {
      case operation_tag_t::deposit:
        result.value =
            encoder_.encode(std::tuple{hooks.deposit_hooks, hooks.deposit_watermark});
        break;
      case operation_tag_t::withdraw:
        result.value = encoder_.encode(
            std::tuple{hooks.withdraw_hooks, hooks.withdraw_watermark});
        break;
      case operation_tag_t::transfer:
        result.value = encoder_.encode(
            std::tuple{hooks.transfer_hooks, hooks.transfer_watermark});
        break;
    }
    return result;
  }

  if (path == "/state/hook") {
    auto hook_id = encoder_.try_decode<hash32_t>(data);
    if (!hook_id) {
      return invalid_key();
    }
    auto it = state.hooks.find(*hook_id);
    if (it == std::end(state.hooks)) {
      return not_found();
    }
    result.value = encoder_.encode(it->second);
    return result;
  }

  if (path == "/state/escrow/deposit") {
    auto key = encoder_.try_decode<std::tuple<hash32_t, hash32_t>>(data);
    if (!key) {
      return invalid_key();
    }
    auto it = state.escrows.find(std::get<0>(*key));
    if (it == std::end(state.escrows)) {
      return not_found();
    }
    const auto& deposits = it->second.deposits;
    auto deposit = std::find_if(
        std::begin(deposits), std::end(deposits),
        [&](const auto& entry) { return entry.deposit_id == std::get<1>(*key); });
    if (deposit == std::end(deposits)) {
      return not_found();
    }
    result.value = encoder_.encode(*deposit);
    return result;
  }

  if (path == "/state/escrow/ledger") {
    auto vault_id = encoder_.try_decode<hash32_t>(data);
    if (!vault_id) {
      return invalid_key();
    }
    auto it = state.escrows.find(*vault_id);
    if (it == std::end(state.escrows)) {
      return not_found();
    }
    result.value = encoder_.encode(std::tuple{
        it->second.total_pending, it->second.round, it->second.user_pending});
    return result;
  }

  if (path == "/state/oracle" || path == "/state/oracle/price" ||
      path == "/state/oracle/report") {
    auto oracle_id = encoder_.try_decode<hash32_t>(data);
    if (!oracle_id) {
      return invalid_key();
    }
    auto it = state.oracles.find(*oracle_id);
    if (it == std::end(state.oracles)) {
      return not_found();
    }
    const auto& oracle = it->second;
    if (path == "/state/oracle") {
      result.value = encoder_.encode(oracle);
    } else if (path == "/state/oracle/price") {
      result.value = encoder_.encode(std::tuple{
          tranche::oracle::price_at(oracle, committed_block_time_),
          tranche::oracle::transition_progress_bps(oracle,
                                                   committed_block_time_)});
    } else {
      result.value = encode_uint256(
          tranche::oracle::price_at(oracle, committed_block_time_));
    }
    return result;
  }

  if (path == "/state/withdrawal/nonce") {
    auto key =
        encoder_.try_decode<std::tuple<hash32_t, account_id_t, uint64_t>>(data);
    if (!key) {
      return invalid_key();
    }
    auto it = state.withdrawal_nonces.find(std::get<0>(*key));
    if (it == std::end(state.withdrawal_nonces)) {
      return not_found();
    }
    const auto& used = it->second.used;
    auto found = std::any_of(std::begin(used), std::end(used), [&](const auto& row) {
      return row.owner == std::get<1>(*key) && row.nonce == std::get<2>(*key);
    });
    result.value = encoder_.encode(found);
    return result;
  }

  if (path == "/state/asset/balance") {
    auto key = encoder_.try_decode<std::tuple<asset_id_t, account_id_t>>(data);
    if (!key) {
      return invalid_key();
    }
    auto row = std::find_if(
        std::begin(state.balances), std::end(state.balances),
        [&](const auto& entry) {
          return entry.asset_id == std::get<0>(*key) &&
                 entry.account == std::get<1>(*key);
        });
    result.value = encoder_.encode(
        row == std::end(state.balances) ? amount_t{0} : row->amount);
    return result;
  }

  if (path == "/history/range") {
    auto key = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!key || std::get<0>(*key) > std::get<1>(*key)) {
      return invalid_key();
    }
    auto rows = std::vector<history_entry_t>{};
    auto prefix = tranche::schema::key::make_prefix_key(
        tranche::schema::key::kHistoryPrefix);
    for (auto& entry : decode_rows<history_entry_t>(
             encoder_, storage_.list_by_prefix(bytes_view_t{prefix}))) {
      if (entry.height >= std::get<0>(*key) &&
          entry.height <= std::get<1>(*key)) {
        rows.push_back(std::move(entry));
      }
    }
    std::sort(std::begin(rows), std::end(rows), [](const auto& a, const auto& b) {
      return std::tie(a.height, a.index) < std::tie(b.height, b.index);
    });
    result.value = encoder_.encode(rows);
    return result;
  }

  spdlog::warn("Unsupported query path {}", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path", data, last_committed_height_);
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = tranche::schema::key::make_prefix_key(
      tranche::schema::key::kHistoryPrefix);
  auto rows = std::vector<history_entry_t>{};
  for (auto& entry : decode_rows<history_entry_t>(
           encoder_, storage_.list_by_prefix(bytes_view_t{prefix}))) {
    if (entry.height >= from_height && entry.height <= to_height) {
      rows.push_back(std::move(entry));
    }
  }
  std::sort(std::begin(rows), std::end(rows), [](const auto& a, const auto& b) {
    return std::tie(a.height, a.index) < std::tie(b.height, b.index);
  });
  return rows;
}

replay_result_t engine::replay_history() {
  auto lock = std::scoped_lock{mutex_};
  auto result = replay_result_t{};

  auto prefix = tranche::schema::key::make_prefix_key(
      tranche::schema::key::kHistoryPrefix);
  auto rows = decode_rows<history_entry_t>(
      encoder_, storage_.list_by_prefix(bytes_view_t{prefix}));
  std::sort(std::begin(rows), std::end(rows), [](const auto& a, const auto& b) {
    return std::tie(a.height, a.index) < std::tie(b.height, b.index);
  });

  auto state = make_genesis_state();
  auto root = make_zero_hash();
  for (const auto& entry : rows) {
    auto tx_result = execute_transaction(state, entry.block_time, entry.tx);
    ++result.tx_count;
    if (tx_result.code != entry.code) {
      result.error = "result code mismatch at height " +
                     std::to_string(entry.height) + " index " +
                     std::to_string(entry.index);
      result.last_height = static_cast<int64_t>(entry.height);
      result.state_root = root;
      spdlog::error("Replay diverged: {}", result.error);
      return result;
    }
    if (tx_result.code == 0) {
      root = fold_state_root(root, entry.tx, entry.height, entry.index);
      ++result.applied_count;
    }
    result.last_height = static_cast<int64_t>(entry.height);
  }

  result.state_root = root;
  result.ok = root == last_committed_state_root_;
  if (!result.ok) {
    result.error = "replayed state root does not match committed state root";
    spdlog::error("Replay diverged: {}", result.error);
  } else {
    spdlog::info("Replayed {} transaction(s) up to height {}", result.tx_count,
                 result.last_height);
  }
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

ledger_state engine::make_genesis_state() const {
  auto state = ledger_state{};
  if (is_null_account(config_.genesis_admin)) {
    spdlog::warn("No genesis admin configured; privileged operations are "
                 "unavailable");
    return state;
  }
  auto roles = role_book{state.roles};
  roles.assign(config_.genesis_admin, role_id_t::admin, true);
  return state;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  namespace key = tranche::schema::key;
  auto committed = storage_.load_committed_state();
  if (!committed) {
    tranche::common::critical("committed state disappeared during load");
  }
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;

  auto rows = [&](const std::string_view prefix) {
    auto bytes = key::make_prefix_key(prefix);
    return storage_.list_by_prefix(bytes_view_t{bytes});
  };

  auto state = ledger_state{};
  auto clock = storage_.get<std::tuple<uint64_t, timestamp_seconds_t>>(
      encoder_, make_bytes_view(key::kClockKey));
  if (clock) {
    state.sequence = std::get<0>(*clock);
    committed_block_time_ = std::get<1>(*clock);
  }
  for (const auto& [account, nonce] :
       decode_rows<std::tuple<account_id_t, uint64_t>>(
           encoder_, rows(key::kNonceKeyPrefix))) {
    state.signer_nonces.emplace(account, nonce);
  }
  state.roles = decode_rows<role_assignment_t>(encoder_,
                                               rows(key::kRoleKeyPrefix));
  std::sort(std::begin(state.roles), std::end(state.roles),
            [](const auto& a, const auto& b) {
              return std::tie(a.subject, a.role) < std::tie(b.subject, b.role);
            });
  state.balances = decode_rows<asset_balance_t>(
      encoder_, rows(key::kAssetBalanceKeyPrefix));
  std::sort(std::begin(state.balances), std::end(state.balances),
            [](const auto& a, const auto& b) {
              return std::tie(a.asset_id, a.account) <
                     std::tie(b.asset_id, b.account);
            });
  for (auto& vault :
       decode_rows<vault_state_t>(encoder_, rows(key::kVaultKeyPrefix))) {
    auto vault_id = vault.config.vault_id;
    state.vaults.emplace(vault_id, std::move(vault));
  }
  for (auto& escrow :
       decode_rows<escrow_state_t>(encoder_, rows(key::kEscrowKeyPrefix))) {
    auto vault_id = escrow.vault_id;
    state.escrows.emplace(vault_id, std::move(escrow));
  }
  for (auto& oracle :
       decode_rows<oracle_state_t>(encoder_, rows(key::kOracleKeyPrefix))) {
    auto oracle_id = oracle.oracle_id;
    state.oracles.emplace(oracle_id, std::move(oracle));
  }
  for (auto& hook :
       decode_rows<hook_record_t>(encoder_, rows(key::kHookKeyPrefix))) {
    auto hook_id = hook.hook_id;
    state.hooks.emplace(hook_id, std::move(hook));
  }
  for (auto& nonces : decode_rows<withdrawal_nonce_state_t>(
           encoder_, rows(key::kWithdrawalNonceKeyPrefix))) {
    auto vault_id = nonces.vault_id;
    state.withdrawal_nonces.emplace(vault_id, std::move(nonces));
  }
  committed_state_ = std::move(state);
}

tranche::storage::commit_batch engine::make_commit_batch(
    const ledger_state& state,
    const timestamp_seconds_t block_time,
    const std::vector<history_entry_t>& history,
    const int64_t height,
    const hash32_t& state_root) const {
  namespace key = tranche::schema::key;
  auto batch = tranche::storage::commit_batch{};
  batch.state_prefix = key::make_prefix_key(key::kStatePrefix);
  batch.checkpoint = tranche::storage::committed_state{
      .height = height, .state_root = state_root};
  for (const auto& entry : history) {
    batch.appended_rows.emplace_back(
        key::make_history_key(encoder_, entry.height, entry.index),
        encoder_.encode(entry));
  }

  auto& entries = batch.state_rows;
  auto add = [&](bytes_t row_key, const auto& value) {
    entries.emplace_back(std::move(row_key), encoder_.encode(value));
  };

  add(make_bytes(key::kClockKey), std::tuple{state.sequence, block_time});
  for (const auto& [account, nonce] : state.signer_nonces) {
    add(key::make_nonce_key(encoder_, account), std::tuple{account, nonce});
  }
  for (const auto& role : state.roles) {
    add(key::make_role_key(encoder_, role.subject, role.role), role);
  }
  for (const auto& balance : state.balances) {
    add(key::make_asset_balance_key(encoder_, balance.asset_id, balance.account),
        balance);
  }
  for (const auto& [vault_id, vault] : state.vaults) {
    add(key::make_vault_key(encoder_, vault_id), vault);
  }
  for (const auto& [vault_id, escrow] : state.escrows) {
    add(key::make_escrow_key(encoder_, vault_id), escrow);
  }
  for (const auto& [oracle_id, oracle] : state.oracles) {
    add(key::make_oracle_key(encoder_, oracle_id), oracle);
  }
  for (const auto& [hook_id, hook] : state.hooks) {
    add(key::make_hook_key(encoder_, hook_id), hook);
  }
  for (const auto& [vault_id, nonces] : state.withdrawal_nonces) {
    add(key::make_withdrawal_nonce_key(encoder_, vault_id), nonces);
  }

  return batch;
}

}  // namespace tranche::execution
