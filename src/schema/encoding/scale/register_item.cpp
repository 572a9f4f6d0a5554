#include <notary/schema/encoding/scale/register_item.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(register_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.uri, encoder);
  encode(o.category, encoder);
}

void decode(register_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.uri, decoder);
  decode(o.category, decoder);
}

}  // namespace notary::schema::encoding::scale
