#pragma once
#include <notary/schema/revoke_document.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(revoke_document<1>&& o, ::scale::Encoder& encoder);
void decode(revoke_document<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
