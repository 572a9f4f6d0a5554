#pragma once
#include <notary/schema/item_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(item_state<1>&& o, ::scale::Encoder& encoder);
void decode(item_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
