#pragma once

#include <array>
#include <notary/schema/primitives.hpp>
#include <notary/schema/role_id.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key builders for ledger state, history, and the
// persisted event log.
namespace notary::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kChainIdKey{"SYS|STATE|CHAIN_ID|"};
inline constexpr std::string_view kOwnerKey{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kTreasuryAccountKey{"SYS|STATE|TREASURY|"};
inline constexpr std::string_view kStorageFeeKey{"SYS|STATE|STORAGE_FEE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|STATE|ROLE|"};
inline constexpr std::string_view kItemKeyPrefix{"SYS|STATE|ITEM|"};
inline constexpr std::string_view kDocumentKeyPrefix{"SYS|STATE|DOCUMENT|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|STATE|SEQUENCE|"};
inline constexpr std::string_view kSubmitterIndexPrefix{
    "SYS|STATE|INDEX|SUBMITTER|"};
inline constexpr std::string_view kCreatorIndexPrefix{
    "SYS|STATE|INDEX|CREATOR|"};
inline constexpr std::string_view kSignerIndexPrefix{"SYS|STATE|INDEX|SIGNER|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 15> kEngineKeyspaces{
    kStatePrefix,
    kChainIdKey,
    kOwnerKey,
    kTreasuryAccountKey,
    kStorageFeeKey,
    kNonceKeyPrefix,
    kRoleKeyPrefix,
    kItemKeyPrefix,
    kDocumentKeyPrefix,
    kSequenceKeyPrefix,
    kSubmitterIndexPrefix,
    kCreatorIndexPrefix,
    kSignerIndexPrefix,
    kHistoryPrefix,
    kEventPrefix};

/// Names of the engine-owned monotonic counters.
inline constexpr std::string_view kItemSequence{"ITEM"};
inline constexpr std::string_view kDocumentSequence{"DOCUMENT"};
inline constexpr std::string_view kEventSequence{"EVENT"};

template <typename Encoder, typename T>
notary::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
notary::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
notary::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const notary::schema::account_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
notary::schema::bytes_t make_role_key(
    Encoder& encoder,
    const notary::schema::account_id_t& account,
    const notary::schema::role_id_t role) {
  return make_prefixed_key(encoder, kRoleKeyPrefix, std::tuple{account, role});
}

template <typename Encoder>
notary::schema::bytes_t make_item_key(Encoder& encoder,
                                      const notary::schema::item_id_t id) {
  return make_prefixed_key(encoder, kItemKeyPrefix, id);
}

template <typename Encoder>
notary::schema::bytes_t make_document_key(
    Encoder& encoder,
    const notary::schema::document_id_t id) {
  return make_prefixed_key(encoder, kDocumentKeyPrefix, id);
}

template <typename Encoder>
notary::schema::bytes_t make_sequence_key(Encoder& encoder,
                                          const std::string_view name) {
  return make_prefixed_key(encoder, kSequenceKeyPrefix, name);
}

template <typename Encoder>
notary::schema::bytes_t make_index_key(
    Encoder& encoder,
    const std::string_view index_prefix,
    const notary::schema::account_id_t& account) {
  return make_prefixed_key(encoder, index_prefix, account);
}

template <typename Encoder>
notary::schema::bytes_t make_history_key(Encoder& encoder,
                                         const uint64_t height,
                                         const uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

template <typename Encoder>
notary::schema::bytes_t make_event_key(Encoder& encoder,
                                       const uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

}  // namespace notary::schema::key
