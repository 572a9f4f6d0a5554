#pragma once
#include <notary/schema/withdraw_fees.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(withdraw_fees<1>&& o, ::scale::Encoder& encoder);
void decode(withdraw_fees<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
