#include <blake3.h>
#include <notary/blake3/hash.hpp>

namespace notary::blake3 {

notary::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = notary::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<notary::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

notary::schema::hash32_t hash(const notary::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = notary::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace notary::blake3
