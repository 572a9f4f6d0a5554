#include <notary/schema/encoding/scale/set_storage_fee.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(set_storage_fee<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fee, encoder);
}

void decode(set_storage_fee<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fee, decoder);
}

}  // namespace notary::schema::encoding::scale
