#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <notary/blake3/hash.hpp>
#include <notary/common/critical.hpp>
#include <notary/execution/access_control.hpp>
#include <notary/execution/attestation.hpp>
#include <notary/execution/engine.hpp>
#include <notary/execution/registry.hpp>
#include <notary/execution/result.hpp>
#include <notary/execution/sequence.hpp>
#include <notary/execution/treasury.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/schema/query_error_code.hpp>
#include <tuple>
#include <utility>

using namespace notary::schema;

namespace {

using encoder_t = notary::execution::encoder_t;

constexpr auto kQueryCodespace = std::string_view{"notary.query"};
constexpr auto kFirstEventId = uint64_t{1};
constexpr auto kEventIds = notary::execution::sequence{
    notary::schema::key::kEventSequence, kFirstEventId};

notary::schema::hash32_t fold_state_root(const notary::schema::hash32_t& seed,
                                         const notary::schema::bytes_view_t& tx,
                                         uint64_t height,
                                         uint64_t index) {
  auto material = notary::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return notary::blake3::hash(
      notary::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<notary::schema::transaction_t> decode_transaction(
    encoder_t& encoder,
    const notary::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<notary::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction bytes do not decode";
  }
  return tx;
}

notary::schema::query_result_t make_query_error(
    const notary::schema::query_error_code code,
    std::string log,
    const notary::schema::bytes_view_t& key,
    const int64_t height) {
  auto result = notary::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{kQueryCodespace};
  result.key = notary::schema::make_bytes(key);
  result.height = height;
  return result;
}

template <typename T>
notary::schema::query_result_t make_query_value(
    encoder_t& encoder,
    const T& value,
    const notary::schema::bytes_view_t& key,
    const int64_t height) {
  auto result = notary::schema::query_result_t{};
  result.codespace = std::string{kQueryCodespace};
  result.key = notary::schema::make_bytes(key);
  result.value = encoder.encode(value);
  result.height = height;
  return result;
}

notary::schema::transaction_result_t make_reentrant_result() {
  auto result = notary::execution::make_error(
      notary::schema::transaction_error_code::reentrant,
      "re-entrant call rejected");
  result.codespace = std::string{notary::execution::kDeliverCodespace};
  return result;
}

}  // namespace

namespace notary::execution {

engine::engine(std::string db_path) : db_path_(std::move(db_path)) {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing notary engine with RocksDB path '{}'", db_path_);

  storage_ = notary::storage::make_storage<notary::storage::rocksdb_storage_tag>(
      db_path_);
  load_persisted_state();
  spdlog::info("Notary engine ready at height {}{}", last_committed_height_,
               chain_id_ ? "" : " (chain not initialized)");
}

bool engine::init_chain(const genesis_state_t& genesis) {
  auto lock = std::scoped_lock{mutex_};
  if (entered_) {
    spdlog::error("Rejected chain initialization during value transfer");
    return false;
  }
  if (chain_id_.has_value()) {
    spdlog::error("Chain is already initialized");
    return false;
  }
  if (is_null_account(genesis.owner) ||
      is_null_account(genesis.treasury_account)) {
    spdlog::error("Genesis owner and treasury account must not be null");
    return false;
  }

  auto state = state_overlay{storage_};
  auto ctx = execution_context{.state = state,
                               .encoder = encoder_,
                               .rail = rail_,
                               .entered = entered_,
                               .caller = genesis.owner};
  state.put(encoder_, key::make_prefix_key(encoder_, key::kChainIdKey),
            genesis.chain_id);
  access_control::initialize(ctx, genesis.owner);
  treasury::initialize(ctx, genesis.treasury_account, genesis.storage_fee);
  record_events(state, ctx.events, 0, 0, 0);

  storage_.commit_batch(
      state.entries(),
      notary::storage::committed_state{
          .height = last_committed_height_,
          .state_root = last_committed_state_root_,
          .block_time_ms = current_block_time_ms_});
  chain_id_ = genesis.chain_id;
  spdlog::info("Initialized chain {} with owner {}", to_hex(genesis.chain_id),
               to_hex(genesis.owner));
  return true;
}

void engine::set_balance_reader(balance_reader_t reader) {
  auto lock = std::scoped_lock{mutex_};
  rail_.balance = std::move(reader);
}

void engine::set_value_transfer(value_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  rail_.transfer = std::move(transfer);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    auto result = make_error(transaction_error_code::invalid_transaction,
                             "invalid transaction");
    result.info = decode_error;
    result.codespace = std::string{kCheckCodespace};
    return result;
  }

  auto committed = state_overlay{storage_};
  auto result = validate_transaction(*maybe_tx, committed);
  if (result.code != 0) {
    result.codespace = std::string{kCheckCodespace};
    return result;
  }
  result.info = "accepted";
  return result;
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const timestamp_milliseconds_t block_time_ms,
    const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  if (entered_) {
    spdlog::warn("Rejected block {} finalized during value transfer", height);
    result.tx_results.assign(txs.size(), make_reentrant_result());
    result.state_root = pending_state_root_;
    return result;
  }

  open_block(height);
  if (block_time_ms < current_block_time_ms_) {
    spdlog::warn("Block time {} precedes previous block time {}; clamping",
                 block_time_ms, current_block_time_ms_);
  } else {
    current_block_time_ms_ = block_time_ms;
  }

  result.tx_results.reserve(txs.size());
  for (const auto& tx : txs) {
    result.tx_results.push_back(
        deliver_locked(bytes_view_t{tx.data(), tx.size()}));
  }
  result.state_root = pending_state_root_;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

transaction_result_t engine::deliver_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  if (!entered_ && !block_open_) {
    open_block(static_cast<uint64_t>(last_committed_height_) + 1);
  }
  return deliver_locked(raw_tx);
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto result = commit_result_t{};
  if (entered_) {
    spdlog::warn("Rejected commit during value transfer; height stays {}",
                 last_committed_height_);
    result.committed_height = last_committed_height_;
    result.state_root = last_committed_state_root_;
    return result;
  }

  if (block_open_) {
    last_committed_height_ = static_cast<int64_t>(current_block_height_);
    last_committed_state_root_ = pending_state_root_;
  }

  storage_.commit_batch(
      block_state_.entries(),
      notary::storage::committed_state{
          .height = last_committed_height_,
          .state_root = last_committed_state_root_,
          .block_time_ms = current_block_time_ms_});
  block_state_.clear();
  block_open_ = false;
  next_tx_index_ = 0;
  spdlog::info("Committed height {} state root {}", last_committed_height_,
               to_hex(last_committed_state_root_));

  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = chain_id_.value_or(make_zero_hash());
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto committed = state_overlay{storage_};
  auto height = last_committed_height_;

  auto invalid_key = [&]() {
    return make_query_error(query_error_code::invalid_key,
                            "query data does not decode", data, height);
  };
  auto not_found = [&](std::string log) {
    return make_query_error(query_error_code::not_found, std::move(log), data,
                            height);
  };

  if (path == "/engine/info") {
    return make_query_value(
        encoder_,
        std::tuple{last_committed_height_, last_committed_state_root_,
                   chain_id_.value_or(make_zero_hash())},
        data, height);
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& keyspace : key::kEngineKeyspaces) {
      keyspaces.emplace_back(keyspace);
    }
    return make_query_value(encoder_, keyspaces, data, height);
  }
  if (path == "/access/owner") {
    auto current = access_control::owner(committed, encoder_);
    if (!current) {
      return not_found("owner not set");
    }
    return make_query_value(encoder_, *current, data, height);
  }
  if (path == "/access/has_role") {
    auto request = encoder_.try_decode<std::tuple<account_id_t, role_id_t>>(data);
    if (!request) {
      return invalid_key();
    }
    auto granted = access_control::has_role(
        committed, encoder_, std::get<0>(*request), std::get<1>(*request));
    return make_query_value(encoder_, granted, data, height);
  }
  if (path == "/registry/item") {
    auto item_id = encoder_.try_decode<item_id_t>(data);
    if (!item_id) {
      return invalid_key();
    }
    auto item = registry::get_item(committed, encoder_, *item_id);
    if (!item) {
      return not_found("item not found");
    }
    return make_query_value(encoder_, *item, data, height);
  }
  if (path == "/registry/items_of") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_key();
    }
    return make_query_value(
        encoder_, registry::items_of(committed, encoder_, *account), data,
        height);
  }
  if (path == "/attestation/document") {
    auto document_id = encoder_.try_decode<document_id_t>(data);
    if (!document_id) {
      return invalid_key();
    }
    auto document = attestation::get_document(committed, encoder_, *document_id);
    if (!document) {
      return not_found("document not found");
    }
    return make_query_value(encoder_, *document, data, height);
  }
  if (path == "/attestation/has_signed" ||
      path == "/attestation/is_required_signer") {
    auto request =
        encoder_.try_decode<std::tuple<document_id_t, account_id_t>>(data);
    if (!request) {
      return invalid_key();
    }
    auto answer =
        path == "/attestation/has_signed"
            ? attestation::has_user_signed(committed, encoder_,
                                           std::get<0>(*request),
                                           std::get<1>(*request))
            : attestation::is_required_signer(committed, encoder_,
                                              std::get<0>(*request),
                                              std::get<1>(*request));
    return make_query_value(encoder_, answer, data, height);
  }
  if (path == "/attestation/user_documents") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_key();
    }
    return make_query_value(
        encoder_, attestation::user_documents(committed, encoder_, *account),
        data, height);
  }
  if (path == "/attestation/signer_documents") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_key();
    }
    return make_query_value(
        encoder_, attestation::signer_documents(committed, encoder_, *account),
        data, height);
  }
  if (path == "/treasury/state") {
    return make_query_value(
        encoder_,
        std::tuple{treasury::storage_fee(committed, encoder_),
                   treasury::treasury_account(committed, encoder_),
                   treasury::treasury_balance(committed, encoder_, rail_)},
        data, height);
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key();
    }
    return make_query_value(
        encoder_, history(std::get<0>(*range), std::get<1>(*range)), data,
        height);
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key();
    }
    return make_query_value(
        encoder_, events(std::get<0>(*range), std::get<1>(*range)), data,
        height);
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path", data, height);
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<history_entry_t>{};
  if (last_committed_height_ <= 0) {
    return result;
  }
  auto last = std::min(to_height, static_cast<uint64_t>(last_committed_height_));
  for (auto height = from_height; height <= last; ++height) {
    auto prefix = key::make_prefixed_key(encoder_, key::kHistoryPrefix, height);
    auto rows = storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
    auto block = std::vector<history_entry_t>{};
    block.reserve(rows.size());
    for (const auto& [row_key, row_value] : rows) {
      block.push_back(encoder_.decode<history_entry_t>(
          bytes_view_t{row_value.data(), row_value.size()}));
    }
    std::sort(std::begin(block), std::end(block),
              [](const history_entry_t& lhs, const history_entry_t& rhs) {
                return lhs.index < rhs.index;
              });
    result.insert(std::end(result), std::make_move_iterator(std::begin(block)),
                  std::make_move_iterator(std::end(block)));
  }
  return result;
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto committed = state_overlay{storage_};
  auto next_id = kEventIds.peek(committed, encoder_);
  auto result = std::vector<event_record_t>{};
  for (auto id = std::max(from_id, kFirstEventId); id <= to_id && id < next_id;
       ++id) {
    auto record = committed.get<event_record_t>(encoder_,
                                                key::make_event_key(encoder_, id));
    if (!record) {
      notary::common::critical("event log has a gap");
    }
    result.push_back(std::move(*record));
  }
  return result;
}

std::optional<item_state_t> engine::get_item(const item_id_t item_id) const {
  auto lock = std::scoped_lock{mutex_};
  return registry::get_item(state_overlay{storage_}, encoder_, item_id);
}

std::vector<item_id_t> engine::items_of(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return registry::items_of(state_overlay{storage_}, encoder_, account);
}

std::optional<document_state_t> engine::get_document(
    const document_id_t document_id) const {
  auto lock = std::scoped_lock{mutex_};
  return attestation::get_document(state_overlay{storage_}, encoder_,
                                   document_id);
}

bool engine::has_user_signed(const document_id_t document_id,
                             const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return attestation::has_user_signed(state_overlay{storage_}, encoder_,
                                      document_id, account);
}

bool engine::is_required_signer(const document_id_t document_id,
                                const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return attestation::is_required_signer(state_overlay{storage_}, encoder_,
                                         document_id, account);
}

std::vector<document_id_t> engine::user_documents(
    const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return attestation::user_documents(state_overlay{storage_}, encoder_,
                                     account);
}

std::vector<document_id_t> engine::signer_documents(
    const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return attestation::signer_documents(state_overlay{storage_}, encoder_,
                                       account);
}

bool engine::has_role(const account_id_t& account, const role_id_t role) const {
  auto lock = std::scoped_lock{mutex_};
  return access_control::has_role(state_overlay{storage_}, encoder_, account,
                                  role);
}

std::optional<account_id_t> engine::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return access_control::owner(state_overlay{storage_}, encoder_);
}

amount_t engine::storage_fee() const {
  auto lock = std::scoped_lock{mutex_};
  return treasury::storage_fee(state_overlay{storage_}, encoder_);
}

amount_t engine::treasury_balance() const {
  auto lock = std::scoped_lock{mutex_};
  return treasury::treasury_balance(state_overlay{storage_}, encoder_, rail_);
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  const state_overlay& state) {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "unsupported transaction version");
  }
  if (!chain_id_.has_value()) {
    return make_error(transaction_error_code::chain_not_initialized,
                      "chain is not initialized");
  }
  if (tx.chain_id != *chain_id_) {
    return make_error(transaction_error_code::invalid_chain_id,
                      "chain id mismatch");
  }
  auto expected_nonce =
      state.get<uint64_t>(encoder_, key::make_nonce_key(encoder_, tx.signer))
          .value_or(0);
  if (tx.nonce != expected_nonce) {
    auto result =
        make_error(transaction_error_code::invalid_nonce, "nonce mismatch");
    result.info = "expected nonce " + std::to_string(expected_nonce);
    return result;
  }
  if (tx.value != 0 && !std::holds_alternative<create_document_t>(tx.payload)) {
    return make_error(transaction_error_code::unexpected_value,
                      "operation does not accept attached value");
  }
  return make_success();
}

transaction_result_t engine::execute_operation(execution_context& ctx,
                                               const transaction_t& tx) {
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const grant_role_t& payload) {
            result = access_control::grant_role(ctx, payload);
          },
          [&](const revoke_role_t& payload) {
            result = access_control::revoke_role(ctx, payload);
          },
          [&](const transfer_ownership_t& payload) {
            result = access_control::transfer_ownership(ctx, payload);
          },
          [&](const register_item_t& payload) {
            result = registry::register_item(ctx, payload);
          },
          [&](const moderate_item_t& payload) {
            result = registry::moderate_item(ctx, payload);
          },
          [&](const deactivate_item_t& payload) {
            result = registry::deactivate_item(ctx, payload);
          },
          [&](const create_document_t& payload) {
            result = attestation::create_document(ctx, payload);
          },
          [&](const sign_document_t& payload) {
            result = attestation::sign_document(ctx, payload);
          },
          [&](const revoke_document_t& payload) {
            result = attestation::revoke_document(ctx, payload);
          },
          [&](const set_storage_fee_t& payload) {
            result = treasury::set_storage_fee(ctx, payload);
          },
          [&](const withdraw_fees_t& payload) {
            result = treasury::withdraw_fees(ctx, payload);
          }},
      tx.payload);
  return result;
}

transaction_result_t engine::deliver_locked(const bytes_view_t& raw_tx) {
  if (entered_) {
    spdlog::warn("Rejected re-entrant transaction during value transfer");
    return make_reentrant_result();
  }

  auto tx_index = next_tx_index_++;
  auto tx_state = state_overlay{storage_, block_state_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);

  auto result = transaction_result_t{};
  if (!maybe_tx) {
    result = make_error(transaction_error_code::invalid_transaction,
                        "invalid transaction");
    result.info = decode_error;
  } else {
    result = validate_transaction(*maybe_tx, tx_state);
  }

  if (result.code == 0) {
    auto ctx = execution_context{.state = tx_state,
                                 .encoder = encoder_,
                                 .rail = rail_,
                                 .entered = entered_,
                                 .caller = maybe_tx->signer,
                                 .value = maybe_tx->value,
                                 .height = current_block_height_,
                                 .tx_index = tx_index,
                                 .block_time = current_block_time_ms_};
    result = execute_operation(ctx, *maybe_tx);
    if (result.code == 0) {
      tx_state.put(encoder_, key::make_nonce_key(encoder_, maybe_tx->signer),
                   static_cast<uint64_t>(maybe_tx->nonce + 1));
      result.events =
          record_events(tx_state, ctx.events, current_block_height_, tx_index,
                        current_block_time_ms_);
      tx_state.merge_into(block_state_);
      pending_state_root_ = fold_state_root(pending_state_root_, raw_tx,
                                            current_block_height_, tx_index);
    }
  }

  if (result.code != 0) {
    result.codespace = std::string{kDeliverCodespace};
    spdlog::debug("Transaction {}:{} failed with code {}: {}",
                  current_block_height_, tx_index, result.code, result.log);
  }

  auto entry = history_entry_t{};
  entry.height = current_block_height_;
  entry.index = tx_index;
  entry.code = result.code;
  if (maybe_tx) {
    entry.sender = maybe_tx->signer;
    entry.nonce = maybe_tx->nonce;
  }
  entry.tx = make_bytes(raw_tx);
  block_state_.put(
      encoder_, key::make_history_key(encoder_, current_block_height_, tx_index),
      entry);
  return result;
}

std::vector<transaction_event_t> engine::record_events(
    state_overlay& state,
    const std::vector<pending_event>& events,
    const uint64_t height,
    const uint32_t tx_index,
    const timestamp_milliseconds_t block_time) {
  auto emitted = std::vector<transaction_event_t>{};
  emitted.reserve(events.size());
  for (const auto& event : events) {
    auto record = event_record_t{};
    record.event_id =
        kEventIds.next(state, encoder_);
    record.height = height;
    record.tx_index = tx_index;
    record.type = event.type;
    record.attributes = event.attributes;
    record.recorded_at = block_time;
    state.put(encoder_, key::make_event_key(encoder_, record.event_id), record);

    auto result_event = transaction_event_t{};
    result_event.type = std::string{to_string(event.type)};
    result_event.attributes = event.attributes;
    emitted.push_back(std::move(result_event));
  }
  return emitted;
}

void engine::open_block(const uint64_t height) {
  if (!block_open_) {
    block_open_ = true;
    next_tx_index_ = 0;
    pending_state_root_ = last_committed_state_root_;
  }
  current_block_height_ = height;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    current_block_time_ms_ = committed->block_time_ms;
  } else {
    last_committed_state_root_ = make_zero_hash();
    storage_.save_committed_state(notary::storage::committed_state{
        .height = last_committed_height_,
        .state_root = last_committed_state_root_});
  }
  pending_state_root_ = last_committed_state_root_;

  auto committed = state_overlay{storage_};
  chain_id_ = committed.get<hash32_t>(
      encoder_, key::make_prefix_key(encoder_, key::kChainIdKey));
}

}  // namespace notary::execution
