#include <notary/schema/encoding/scale/revoke_role.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(revoke_role<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
  encode(o.role, encoder);
}

void decode(revoke_role<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
  decode(o.role, decoder);
}

}  // namespace notary::schema::encoding::scale
