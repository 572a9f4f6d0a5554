#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace notary::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

/// Identifier of a registry item. Allocated from 0.
using item_id_t = uint64_t;
/// Identifier of an attestation document. Allocated from 1.
using document_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

/// True for the all-zero account, which never names a real party.
bool is_null_account(const account_id_t& account);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::optional<amount_t> try_make_amount(std::string_view decimal);

}  // namespace notary::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
