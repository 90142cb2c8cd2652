#include <flywheel/schema/encoding/scale/campaign_status.hpp>
#include <flywheel/schema/encoding/scale/event_record.hpp>

using namespace flywheel::schema;

namespace flywheel::schema::encoding::scale {

void encode(event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.recorded_at, encoder);
  encode(o.event, encoder);
}

void decode(event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.recorded_at, decoder);
  decode(o.event, decoder);
}

}  // namespace flywheel::schema::encoding::scale
