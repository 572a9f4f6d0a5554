#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace notary::execution {

using storage_t =
    notary::storage::storage<notary::storage::rocksdb_storage_tag>;

/// Write-buffering view over committed storage.
///
/// Reads fall through to the parent overlay (when layered) and then to
/// storage. Writes stay local until merged into the parent or drained into a
/// commit batch.
class state_overlay final {
 public:
  explicit state_overlay(const storage_t& storage);
  state_overlay(const storage_t& storage, const state_overlay& parent);

  std::optional<notary::schema::bytes_t> get_raw(
      const notary::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder, const notary::schema::bytes_t& key, const T& value);

  void put_raw(notary::schema::bytes_t key, notary::schema::bytes_t value);

  /// Move every buffered write into `target`, leaving this overlay empty.
  void merge_into(state_overlay& target);

  std::vector<notary::storage::key_value_entry_t> entries() const;
  bool empty() const;
  void clear();

 private:
  const storage_t* storage_;
  const state_overlay* parent_{};
  std::map<notary::schema::bytes_t, notary::schema::bytes_t> writes_;
};

template <typename T, typename Encoder>
std::optional<T> state_overlay::get(Encoder& encoder,
                                    const notary::schema::bytes_t& key) const {
  auto value = get_raw(notary::schema::bytes_view_t{key.data(), key.size()});
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      notary::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void state_overlay::put(Encoder& encoder,
                        const notary::schema::bytes_t& key,
                        const T& value) {
  put_raw(key, encoder.encode(value));
}

}  // namespace notary::execution
