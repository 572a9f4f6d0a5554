#pragma once
#include <notary/schema/grant_role.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(grant_role<1>&& o, ::scale::Encoder& encoder);
void decode(grant_role<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
