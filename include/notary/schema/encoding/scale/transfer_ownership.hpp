#pragma once
#include <notary/schema/transfer_ownership.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(transfer_ownership<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
