#pragma once
#include <flywheel/schema/payout.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace flywheel::schema::encoding::scale {

void encode(payout<1>&& o, ::scale::Encoder& encoder);
void decode(payout<1>&& o, ::scale::Decoder& decoder);

void encode(allocation<1>&& o, ::scale::Encoder& encoder);
void decode(allocation<1>&& o, ::scale::Decoder& decoder);

void encode(distribution<1>&& o, ::scale::Encoder& encoder);
void decode(distribution<1>&& o, ::scale::Decoder& decoder);

}  // namespace flywheel::schema::encoding::scale
