#include <flywheel/schema/encoding/scale/campaign_state.hpp>
#include <flywheel/schema/encoding/scale/campaign_status.hpp>

using namespace flywheel::schema;

namespace flywheel::schema::encoding::scale {

void encode(campaign_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.hooks, encoder);
  encode(o.status, encoder);
}

void decode(campaign_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.hooks, decoder);
  decode(o.status, decoder);
}

}  // namespace flywheel::schema::encoding::scale
