#include <notary/schema/encoding/scale/create_document.hpp>
#include <notary/schema/encoding/scale/deactivate_item.hpp>
#include <notary/schema/encoding/scale/grant_role.hpp>
#include <notary/schema/encoding/scale/moderate_item.hpp>
#include <notary/schema/encoding/scale/register_item.hpp>
#include <notary/schema/encoding/scale/revoke_document.hpp>
#include <notary/schema/encoding/scale/revoke_role.hpp>
#include <notary/schema/encoding/scale/set_storage_fee.hpp>
#include <notary/schema/encoding/scale/sign_document.hpp>
#include <notary/schema/encoding/scale/transfer_ownership.hpp>
#include <notary/schema/encoding/scale/withdraw_fees.hpp>
#include <notary/schema/encoding/scale/transaction.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.value, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.value, decoder);
  decode(o.payload, decoder);
}

}  // namespace notary::schema::encoding::scale
