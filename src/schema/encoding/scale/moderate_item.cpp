#include <notary/schema/encoding/scale/moderate_item.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(moderate_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.item_id, encoder);
  encode(o.verified, encoder);
  encode(o.active, encoder);
}

void decode(moderate_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.item_id, decoder);
  decode(o.verified, decoder);
  decode(o.active, decoder);
}

}  // namespace notary::schema::encoding::scale
