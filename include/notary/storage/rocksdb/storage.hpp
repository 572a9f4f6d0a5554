#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <notary/common/critical.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace notary::storage {

namespace detail {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline notary::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const notary::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline std::string encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time_ms});
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<notary::schema::bytes_t> get_raw(
      const notary::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value);

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const notary::schema::bytes_view_t& prefix) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<notary::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const notary::schema::bytes_view_t& key) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    notary::common::critical("Failed to get value from RocksDB");
  }
  return notary::schema::bytes_t(std::begin(value), std::end(value));
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const notary::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      notary::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const notary::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(notary::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    notary::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    notary::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, notary::schema::hash32_t,
                                    notary::schema::timestamp_milliseconds_t>>(
          notary::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    notary::common::critical("failed to decode committed state");
  }

  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  state.block_time_ms = std::get<2>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto state_status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                                    std::string{detail::kCommittedHeightKey},
                                    detail::encode_committed_state(state));
  if (!state_status.ok()) {
    notary::common::critical("failed to persist committed height");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const notary::schema::bytes_view_t& prefix) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto status = batch.Put(
        detail::to_slice(notary::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            notary::schema::bytes_view_t{value.data(), value.size()}));
    if (!status.ok()) {
      notary::common::critical("failed staging key in commit batch");
    }
  }
  auto state_status = batch.Put(std::string{detail::kCommittedHeightKey},
                                detail::encode_committed_state(state));
  if (!state_status.ok()) {
    notary::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch to RocksDB: {}",
                  write_status.ToString());
    notary::common::critical("failed to commit batch");
  }
}

}  // namespace notary::storage
