#pragma once
#include <notary/schema/document_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(document_state<1>&& o, ::scale::Encoder& encoder);
void decode(document_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
