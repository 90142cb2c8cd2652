#pragma once

#include <flywheel/schema/primitives.hpp>

#include <string_view>

namespace flywheel::execution {

inline constexpr auto kCampaignAddressDomain =
    std::string_view{"flywheel.campaign.v1"};

/// Deterministic campaign address for (hooks, nonce, creation payload).
///
/// The last 20 bytes of blake3(domain || SCALE(hooks, nonce, payload)). The
/// engine derives addresses with this same function, so callers can predict
/// a campaign before creating it.
flywheel::schema::address_t predict_campaign_address(
    const flywheel::schema::address_t& hooks,
    const flywheel::schema::nonce_t& nonce,
    const flywheel::schema::bytes_view_t& hook_data);

}  // namespace flywheel::execution
