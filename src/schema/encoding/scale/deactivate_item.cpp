#include <notary/schema/encoding/scale/deactivate_item.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(deactivate_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.item_id, encoder);
}

void decode(deactivate_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.item_id, decoder);
}

}  // namespace notary::schema::encoding::scale
