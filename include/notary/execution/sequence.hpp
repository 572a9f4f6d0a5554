#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <cstdint>
#include <string_view>

namespace notary::execution {

/// Monotonic id counter persisted as one row holding the next id to hand out.
///
/// Each counter is bound to its row name and first id at construction, so
/// only the module owning a sequence can advance it. Ids are never reused;
/// a transaction that fails discards its overlay and with it the advance.
class sequence final {
 public:
  constexpr sequence(const std::string_view name, const uint64_t first)
      : name_{name}, first_{first} {}

  /// Id the next call to `next` would hand out.
  uint64_t peek(const state_overlay& state, encoder_t& encoder) const {
    return state.get<uint64_t>(encoder, row_key(encoder)).value_or(first_);
  }

  uint64_t next(state_overlay& state, encoder_t& encoder) const {
    auto key = row_key(encoder);
    auto id = state.get<uint64_t>(encoder, key).value_or(first_);
    state.put(encoder, key, static_cast<uint64_t>(id + 1));
    return id;
  }

  constexpr uint64_t first() const { return first_; }

 private:
  notary::schema::bytes_t row_key(encoder_t& encoder) const {
    return notary::schema::key::make_sequence_key(encoder, name_);
  }

  std::string_view name_;
  uint64_t first_{};
};

}  // namespace notary::execution
