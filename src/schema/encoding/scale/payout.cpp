#include <flywheel/schema/encoding/scale/payout.hpp>

using namespace flywheel::schema;

namespace flywheel::schema::encoding::scale {

void encode(payout<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient, encoder);
  encode(o.amount, encoder);
  encode(o.extra_data, encoder);
}

void decode(payout<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient, decoder);
  decode(o.amount, decoder);
  decode(o.extra_data, decoder);
}

void encode(allocation<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.amount, encoder);
  encode(o.extra_data, encoder);
}

void decode(allocation<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.amount, decoder);
  decode(o.extra_data, decoder);
}

void encode(distribution<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient, encoder);
  encode(o.key, encoder);
  encode(o.amount, encoder);
  encode(o.extra_data, encoder);
}

void decode(distribution<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient, decoder);
  decode(o.key, decoder);
  decode(o.amount, decoder);
  decode(o.extra_data, decoder);
}

}  // namespace flywheel::schema::encoding::scale
