#pragma once
#include <notary/schema/deactivate_item.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(deactivate_item<1>&& o, ::scale::Encoder& encoder);
void decode(deactivate_item<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
