#pragma once
#include <flywheel/schema/campaign_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace flywheel::schema::encoding::scale {

void encode(campaign_state<1>&& o, ::scale::Encoder& encoder);
void decode(campaign_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace flywheel::schema::encoding::scale
