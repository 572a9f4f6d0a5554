#pragma once
#include <notary/schema/create_document.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(create_document<1>&& o, ::scale::Encoder& encoder);
void decode(create_document<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
