#pragma once

#include <notary/schema/ledger_event_type.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_event_attribute.hpp>
#include <vector>

// Schema type: event record.
// Persisted audit log row, keyed by a gap-free event id.
namespace notary::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  ledger_event_type_t type{};
  std::vector<transaction_event_attribute_t> attributes;
  timestamp_milliseconds_t recorded_at{};
};

using event_record_t = event_record<1>;

}  // namespace notary::schema
