#include <notary/schema/encoding/scale/genesis_state.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(genesis_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.owner, encoder);
  encode(o.treasury_account, encoder);
  encode(o.storage_fee, encoder);
}

void decode(genesis_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.owner, decoder);
  decode(o.treasury_account, decoder);
  decode(o.storage_fee, decoder);
}

}  // namespace notary::schema::encoding::scale
