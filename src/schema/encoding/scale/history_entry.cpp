#include <notary/schema/encoding/scale/history_entry.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(history_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.height, encoder);
  encode(o.index, encoder);
  encode(o.code, encoder);
  encode(o.sender, encoder);
  encode(o.nonce, encoder);
  encode(o.tx, encoder);
}

void decode(history_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.height, decoder);
  decode(o.index, decoder);
  decode(o.code, decoder);
  decode(o.sender, decoder);
  decode(o.nonce, decoder);
  decode(o.tx, decoder);
}

}  // namespace notary::schema::encoding::scale
