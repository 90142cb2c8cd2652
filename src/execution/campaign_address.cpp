#include <flywheel/blake3/hash.hpp>
#include <flywheel/execution/campaign_address.hpp>
#include <flywheel/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <iterator>

using namespace flywheel::schema;

namespace flywheel::execution {

address_t predict_campaign_address(const address_t& hooks,
                                   const nonce_t& nonce,
                                   const bytes_view_t& hook_data) {
  auto encoder = encoding::scale_encoder_t{};
  auto preimage = bytes_t{};
  encoder.encode(hooks, preimage);
  encoder.encode(nonce, preimage);
  encoder.encode(make_bytes(hook_data), preimage);

  auto digest = flywheel::blake3::hash(kCampaignAddressDomain,
                                       make_bytes_view(preimage));
  auto address = address_t{};
  std::copy(std::end(digest) - std::size(address), std::end(digest),
            std::begin(address));
  return address;
}

}  // namespace flywheel::execution
