#include <notary/schema/encoding/scale/create_document.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(create_document<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.document_hash, encoder);
  encode(o.required_signers, encoder);
}

void decode(create_document<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.document_hash, decoder);
  decode(o.required_signers, decoder);
}

}  // namespace notary::schema::encoding::scale
