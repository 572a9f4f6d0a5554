#pragma once
#include <notary/schema/sign_document.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(sign_document<1>&& o, ::scale::Encoder& encoder);
void decode(sign_document<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
