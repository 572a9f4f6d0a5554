#pragma once
#include <notary/schema/moderate_item.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(moderate_item<1>&& o, ::scale::Encoder& encoder);
void decode(moderate_item<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
