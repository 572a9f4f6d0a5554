#pragma once
#include <notary/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace notary::storage {

using key_value_entry_t =
    std::pair<notary::schema::bytes_t, notary::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  notary::schema::hash32_t state_root;
  notary::schema::timestamp_milliseconds_t block_time_ms{};
};

template <typename Library>
struct storage {
  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<notary::schema::bytes_t> get_raw(
      const notary::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint (height, state_root and block
  /// time).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const notary::schema::bytes_view_t& prefix) const;

  /// Atomically apply every entry together with the new checkpoint.
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace notary::storage
