#pragma once
#include <notary/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema::encoding::scale {

void encode(transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace notary::schema::encoding::scale
