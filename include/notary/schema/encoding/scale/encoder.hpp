#pragma once
#include <notary/common/critical.hpp>
#include <notary/schema/encoding/encoder.hpp>
#include <notary/schema/encoding/scale/create_document.hpp>
#include <notary/schema/encoding/scale/deactivate_item.hpp>
#include <notary/schema/encoding/scale/document_state.hpp>
#include <notary/schema/encoding/scale/event_record.hpp>
#include <notary/schema/encoding/scale/genesis_state.hpp>
#include <notary/schema/encoding/scale/grant_role.hpp>
#include <notary/schema/encoding/scale/history_entry.hpp>
#include <notary/schema/encoding/scale/item_state.hpp>
#include <notary/schema/encoding/scale/moderate_item.hpp>
#include <notary/schema/encoding/scale/register_item.hpp>
#include <notary/schema/encoding/scale/revoke_document.hpp>
#include <notary/schema/encoding/scale/revoke_role.hpp>
#include <notary/schema/encoding/scale/set_storage_fee.hpp>
#include <notary/schema/encoding/scale/sign_document.hpp>
#include <notary/schema/encoding/scale/transaction.hpp>
#include <notary/schema/encoding/scale/transaction_event.hpp>
#include <notary/schema/encoding/scale/transaction_event_attribute.hpp>
#include <notary/schema/encoding/scale/transaction_result.hpp>
#include <notary/schema/encoding/scale/transfer_ownership.hpp>
#include <notary/schema/encoding/scale/withdraw_fees.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace notary::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  notary::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, notary::schema::bytes_t& out);

  /// Decode trusted bytes (our own persisted rows). Undecodable input is a
  /// storage corruption and terminates the process.
  template <typename T>
  T decode(const notary::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes (transactions, query keys).
  template <typename T>
  std::optional<T> try_decode(const notary::schema::bytes_view_t& bytes);
};

template <typename T>
notary::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    notary::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        notary::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const notary::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    notary::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const notary::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace notary::schema::encoding
