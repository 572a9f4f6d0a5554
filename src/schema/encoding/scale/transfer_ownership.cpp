#include <notary/schema/encoding/scale/transfer_ownership.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(transfer_ownership<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
}

}  // namespace notary::schema::encoding::scale
