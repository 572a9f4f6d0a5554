#pragma once

#include <notary/execution/state_overlay.hpp>
#include <notary/execution/value_rail.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/ledger_event_type.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <vector>

namespace notary::execution {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

/// Event raised by an operation, kept until the transaction commits into the
/// block.
struct pending_event final {
  notary::schema::ledger_event_type_t type{};
  std::vector<notary::schema::transaction_event_attribute_t> attributes;
};

/// Everything one transaction may read or touch while it executes.
struct execution_context final {
  state_overlay& state;
  encoder_t& encoder;
  const value_rail& rail;
  bool& entered;
  notary::schema::account_id_t caller{};
  notary::schema::amount_t value;
  uint64_t height{};
  uint32_t tx_index{};
  notary::schema::timestamp_milliseconds_t block_time{};
  std::vector<pending_event> events;
};

}  // namespace notary::execution
