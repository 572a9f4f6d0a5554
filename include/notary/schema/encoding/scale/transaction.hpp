#pragma once
#include <notary/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder);
void decode(transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
