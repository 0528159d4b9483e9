#pragma once

#include <timelock/execution/signature_verifier.hpp>
#include <timelock/ledger/token_ledger.hpp>
#include <timelock/schema/app_info.hpp>
#include <timelock/schema/block_result.hpp>
#include <timelock/schema/commit_result.hpp>
#include <timelock/schema/encoding/encoder.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/schema/history_entry.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/schema/query_result.hpp>
#include <timelock/schema/transaction.hpp>
#include <timelock/schema/transaction_error_code.hpp>
#include <timelock/schema/transaction_result.hpp>
#include <timelock/state/overlay.hpp>
#include <timelock/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace timelock::execution {

inline constexpr auto kDefaultChainName = std::string_view{"timelock-local"};

/// Chain id committed into every transaction envelope.
timelock::schema::hash32_t make_chain_id(std::string_view chain_name);

/// Bytes covered by the envelope signature: SCALE of
/// (version, chain_id, nonce, signer, payload).
timelock::schema::bytes_t make_signing_payload(
    timelock::schema::encoding::encoder<
        timelock::schema::encoding::scale_encoder_tag>& encoder,
    const timelock::schema::transaction_t& tx);

/// Deterministic vault state machine used by the ABCI server.
///
/// The engine validates transaction envelopes, runs host payloads and vault
/// instructions against a pending overlay, and persists the overlay together
/// with history rows on commit.
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and runtime options.
  ///
  /// `require_strict_crypto` enables ed25519 verification; when false every
  /// signature is accepted (test networks only).
  explicit engine(
      timelock::schema::encoding::encoder<
          timelock::schema::encoding::scale_encoder_tag>& encoder,
      timelock::storage::storage<timelock::storage::rocksdb_storage_tag>&
          storage,
      std::string_view chain_name = kDefaultChainName,
      bool require_strict_crypto = true);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Decodes and checks the envelope against committed state. Never mutates
  /// state.
  timelock::schema::transaction_result_t check_transaction(
      const timelock::schema::bytes_view_t& raw_tx);

  /// Validate a transaction in the proposal flow. Same checks as CheckTx.
  timelock::schema::transaction_result_t process_proposal_transaction(
      const timelock::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block at `block_time` (unix seconds).
  ///
  /// Transactions run in order, each in its own transactional scope;
  /// per-tx results are returned even on failures. Any earlier uncommitted
  /// block is discarded.
  timelock::schema::block_result_t finalize_block(
      uint64_t height,
      timelock::schema::timestamp_seconds_t block_time,
      const std::vector<timelock::schema::bytes_t>& txs);

  /// Persist the latest finalized block in one storage batch.
  timelock::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  timelock::schema::app_info_t info() const;

  /// Execute a read-path query against committed state.
  timelock::schema::query_result_t query(
      std::string_view path,
      const timelock::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<timelock::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Install a hook run inside every token transfer.
  void set_transfer_hook(timelock::ledger::transfer_hook_t hook);

  const timelock::schema::hash32_t& chain_id() const;

 private:
  /// Run a validated transaction payload and return its result.
  timelock::schema::transaction_result_t execute_operation(
      const timelock::schema::transaction_t& tx,
      timelock::schema::timestamp_seconds_t block_time);

  /// Validate version, chain id, nonce and signature.
  ///
  /// When `expected_nonce` is set the nonce must match it exactly; otherwise
  /// it only has to be ahead of the committed nonce.
  timelock::schema::transaction_result_t validate_transaction(
      const timelock::schema::transaction_t& tx,
      std::string_view codespace,
      std::optional<uint64_t> expected_nonce);

  uint64_t committed_nonce(const timelock::schema::account_id_t& signer) const;
  uint64_t pending_nonce(const timelock::schema::account_id_t& signer) const;

  std::vector<timelock::schema::history_entry_t> load_history(
      uint64_t from_height,
      uint64_t to_height) const;

  timelock::schema::query_result_t query_state(
      std::string_view path,
      const timelock::schema::bytes_view_t& data);

  /// Load committed state from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  timelock::schema::encoding::encoder<
      timelock::schema::encoding::scale_encoder_tag>& encoder_;
  timelock::storage::storage<timelock::storage::rocksdb_storage_tag>& storage_;
  timelock::state::overlay pending_state_;
  timelock::ledger::token_ledger ledger_;
  std::vector<timelock::storage::key_value_entry_t> pending_history_;
  int64_t last_committed_height_{};
  timelock::schema::hash32_t last_committed_state_root_;
  int64_t pending_height_{};
  timelock::schema::hash32_t pending_state_root_;
  timelock::schema::hash32_t chain_id_;
  bool require_strict_crypto_{true};
  bool signature_verifier_overridden_{false};
  signature_verifier_t signature_verifier_;
};

}  // namespace timelock::execution
