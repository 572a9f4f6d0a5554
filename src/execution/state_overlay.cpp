#include <notary/execution/state_overlay.hpp>
#include <iterator>
#include <utility>

namespace notary::execution {

state_overlay::state_overlay(const storage_t& storage) : storage_{&storage} {}

state_overlay::state_overlay(const storage_t& storage,
                             const state_overlay& parent)
    : storage_{&storage}, parent_{&parent} {}

std::optional<notary::schema::bytes_t> state_overlay::get_raw(
    const notary::schema::bytes_view_t& key) const {
  auto it = writes_.find(notary::schema::make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->get_raw(key);
  }
  return storage_->get_raw(key);
}

void state_overlay::put_raw(notary::schema::bytes_t key,
                            notary::schema::bytes_t value) {
  writes_.insert_or_assign(std::move(key), std::move(value));
}

void state_overlay::merge_into(state_overlay& target) {
  for (auto& [key, value] : writes_) {
    target.writes_.insert_or_assign(key, std::move(value));
  }
  writes_.clear();
}

std::vector<notary::storage::key_value_entry_t> state_overlay::entries()
    const {
  auto result = std::vector<notary::storage::key_value_entry_t>{};
  result.reserve(writes_.size());
  for (const auto& [key, value] : writes_) {
    result.push_back(notary::storage::key_value_entry_t{key, value});
  }
  return result;
}

bool state_overlay::empty() const {
  return writes_.empty();
}

void state_overlay::clear() {
  writes_.clear();
}

}  // namespace notary::execution
