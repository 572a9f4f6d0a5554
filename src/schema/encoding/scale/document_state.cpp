#include <notary/schema/encoding/scale/document_state.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(document_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.document_id, encoder);
  encode(o.document_hash, encoder);
  encode(o.creator, encoder);
  encode(o.created_at, encoder);
  encode(o.required_signers, encoder);
  encode(o.signatures, encoder);
  encode(o.signature_count, encoder);
  encode(o.is_active, encoder);
  encode(o.is_completed, encoder);
}

void decode(document_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.document_id, decoder);
  decode(o.document_hash, decoder);
  decode(o.creator, decoder);
  decode(o.created_at, decoder);
  decode(o.required_signers, decoder);
  decode(o.signatures, decoder);
  decode(o.signature_count, decoder);
  decode(o.is_active, decoder);
  decode(o.is_completed, decoder);
}

}  // namespace notary::schema::encoding::scale
