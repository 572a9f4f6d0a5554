#include <notary/schema/encoding/scale/revoke_document.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(revoke_document<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.document_id, encoder);
}

void decode(revoke_document<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.document_id, decoder);
}

}  // namespace notary::schema::encoding::scale
