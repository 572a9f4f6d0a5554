#include <notary/schema/encoding/scale/transaction_event_attribute.hpp>
#include <notary/schema/encoding/scale/event_record.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.height, encoder);
  encode(o.tx_index, encoder);
  encode(o.type, encoder);
  encode(o.attributes, encoder);
  encode(o.recorded_at, encoder);
}

void decode(event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.height, decoder);
  decode(o.tx_index, decoder);
  decode(o.type, decoder);
  decode(o.attributes, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace notary::schema::encoding::scale
