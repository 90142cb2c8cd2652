#pragma once
#include <flywheel/schema/ledger_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace flywheel::schema::encoding::scale {

void encode(event_record<1>&& o, ::scale::Encoder& encoder);
void decode(event_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace flywheel::schema::encoding::scale
