#pragma once

#include <notary/execution/context.hpp>
#include <notary/execution/state_overlay.hpp>
#include <notary/execution/value_rail.hpp>
#include <notary/schema/app_info.hpp>
#include <notary/schema/block_result.hpp>
#include <notary/schema/commit_result.hpp>
#include <notary/schema/document_state.hpp>
#include <notary/schema/event_record.hpp>
#include <notary/schema/genesis_state.hpp>
#include <notary/schema/history_entry.hpp>
#include <notary/schema/item_state.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/query_result.hpp>
#include <notary/schema/role_id.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_result.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notary::execution {

/// Deterministic ledger state machine for the item registry and document
/// attestation workflows.
///
/// The engine admits SCALE-encoded transactions, executes each against a
/// private overlay that is merged into the pending block only on success,
/// and persists the block atomically on commit. Every public call is
/// serialized on one recursive mutex so value-rail callbacks may call back
/// into the engine from the same thread.
class engine final {
 public:
  /// Open (or create) the RocksDB state directory at `db_path` and load the
  /// last committed height and state root.
  explicit engine(std::string db_path);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Write genesis state: chain id, owner (granted admin), treasury account
  /// and storage fee. Returns false when the chain is already initialized,
  /// a genesis account is the null identity, or a value-rail callback is
  /// running.
  bool init_chain(const notary::schema::genesis_state_t& genesis);

  /// Install the environment's native balance reader.
  void set_balance_reader(balance_reader_t reader);

  /// Install the environment's native value transfer.
  void set_value_transfer(value_transfer_t transfer);

  /// Admission check against committed state (CheckTx semantics).
  ///
  /// Decodes and validates the envelope only; never mutates state.
  notary::schema::transaction_result_t check_transaction(
      const notary::schema::bytes_view_t& raw_tx);

  /// Execute a block's transactions in order and return per-transaction
  /// results plus the candidate state root.
  ///
  /// `block_time_ms` is clamped so block time never moves backwards, across
  /// restarts included. Called from a value-rail callback, every transaction
  /// fails with `reentrant` and the pending block is left as it was.
  notary::schema::block_result_t finalize_block(
      uint64_t height,
      notary::schema::timestamp_milliseconds_t block_time_ms,
      const std::vector<notary::schema::bytes_t>& txs);

  /// Execute one transaction as the next entry of the pending block,
  /// opening a block at the next height when none is pending.
  ///
  /// While a value-rail callback is running this fails with `reentrant`
  /// and has no effect at all.
  notary::schema::transaction_result_t deliver_transaction(
      const notary::schema::bytes_view_t& raw_tx);

  /// Persist the pending block (state rows, history, events and the
  /// committed height, state root and block time) in one atomic batch.
  ///
  /// Called from a value-rail callback, nothing is written and the last
  /// committed checkpoint is returned.
  notary::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  notary::schema::app_info_t info() const;

  /// Execute a read-path query by route against committed state.
  notary::schema::query_result_t query(
      std::string_view path,
      const notary::schema::bytes_view_t& data);

  /// Return committed history entries in the inclusive height range.
  std::vector<notary::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Return committed event records in the inclusive event id range.
  std::vector<notary::schema::event_record_t> events(uint64_t from_id,
                                                     uint64_t to_id) const;

  std::optional<notary::schema::item_state_t> get_item(
      notary::schema::item_id_t item_id) const;
  std::vector<notary::schema::item_id_t> items_of(
      const notary::schema::account_id_t& account) const;

  std::optional<notary::schema::document_state_t> get_document(
      notary::schema::document_id_t document_id) const;
  bool has_user_signed(notary::schema::document_id_t document_id,
                       const notary::schema::account_id_t& account) const;
  bool is_required_signer(notary::schema::document_id_t document_id,
                          const notary::schema::account_id_t& account) const;
  std::vector<notary::schema::document_id_t> user_documents(
      const notary::schema::account_id_t& account) const;
  std::vector<notary::schema::document_id_t> signer_documents(
      const notary::schema::account_id_t& account) const;

  bool has_role(const notary::schema::account_id_t& account,
                notary::schema::role_id_t role) const;
  std::optional<notary::schema::account_id_t> owner() const;

  notary::schema::amount_t storage_fee() const;
  notary::schema::amount_t treasury_balance() const;

 private:
  /// Validate version, chain id, nonce and attached value.
  notary::schema::transaction_result_t validate_transaction(
      const notary::schema::transaction_t& tx,
      const state_overlay& state);

  /// Dispatch a validated payload to its component.
  notary::schema::transaction_result_t execute_operation(
      execution_context& ctx,
      const notary::schema::transaction_t& tx);

  notary::schema::transaction_result_t deliver_locked(
      const notary::schema::bytes_view_t& raw_tx);

  /// Persist pending events as event records and return them in result
  /// form.
  std::vector<notary::schema::transaction_event_t> record_events(
      state_overlay& state,
      const std::vector<pending_event>& events,
      uint64_t height,
      uint32_t tx_index,
      notary::schema::timestamp_milliseconds_t block_time);

  void open_block(uint64_t height);
  void load_persisted_state();

  mutable std::recursive_mutex mutex_;
  mutable encoder_t encoder_;
  std::string db_path_;
  storage_t storage_;
  state_overlay block_state_{storage_};
  value_rail rail_;
  bool entered_{false};
  bool block_open_{false};
  int64_t last_committed_height_{};
  notary::schema::hash32_t last_committed_state_root_{};
  notary::schema::hash32_t pending_state_root_{};
  uint64_t current_block_height_{};
  notary::schema::timestamp_milliseconds_t current_block_time_ms_{};
  uint32_t next_tx_index_{};
  std::optional<notary::schema::hash32_t> chain_id_;
};

}  // namespace notary::execution
