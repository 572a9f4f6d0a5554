#pragma once
#include <notary/schema/event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(event_record<1>&& o, ::scale::Encoder& encoder);
void decode(event_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
