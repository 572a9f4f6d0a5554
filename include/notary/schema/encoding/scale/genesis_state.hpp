#pragma once
#include <notary/schema/genesis_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(genesis_state<1>&& o, ::scale::Encoder& encoder);
void decode(genesis_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
