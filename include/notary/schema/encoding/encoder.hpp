#pragma once
#include <notary/schema/primitives.hpp>
#include <optional>
#include <span>

namespace notary::schema::encoding {

// Codec selection is a build-time choice: callers name the library through a
// tag (e.g. encoder<scale_encoder_tag>) and the specialization supplies the
// implementation. Hot swapping codecs is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  notary::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, notary::schema::bytes_t& out);

  template <typename T>
  T decode(const notary::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const notary::schema::bytes_view_t& bytes);
};

}  // namespace notary::schema::encoding
