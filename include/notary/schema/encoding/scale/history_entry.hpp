#pragma once
#include <notary/schema/history_entry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(history_entry<1>&& o, ::scale::Encoder& encoder);
void decode(history_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
