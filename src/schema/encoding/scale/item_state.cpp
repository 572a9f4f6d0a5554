#include <notary/schema/encoding/scale/item_state.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(item_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.item_id, encoder);
  encode(o.submitter, encoder);
  encode(o.uri, encoder);
  encode(o.category, encoder);
  encode(o.created_at, encoder);
  encode(o.is_verified, encoder);
  encode(o.is_active, encoder);
}

void decode(item_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.item_id, decoder);
  decode(o.submitter, decoder);
  decode(o.uri, decoder);
  decode(o.category, decoder);
  decode(o.created_at, decoder);
  decode(o.is_verified, decoder);
  decode(o.is_active, decoder);
}

}  // namespace notary::schema::encoding::scale
