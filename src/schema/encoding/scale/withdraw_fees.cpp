#include <notary/schema/encoding/scale/withdraw_fees.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(withdraw_fees<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(withdraw_fees<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

}  // namespace notary::schema::encoding::scale
