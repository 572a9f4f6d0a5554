#pragma once
#include <notary/schema/register_item.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(register_item<1>&& o, ::scale::Encoder& encoder);
void decode(register_item<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
