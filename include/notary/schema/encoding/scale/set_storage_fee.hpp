#pragma once
#include <notary/schema/set_storage_fee.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(set_storage_fee<1>&& o, ::scale::Encoder& encoder);
void decode(set_storage_fee<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
