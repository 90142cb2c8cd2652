#pragma once
#include <flywheel/schema/campaign_status.hpp>
#include <flywheel/schema/primitives.hpp>

namespace flywheel::schema {

template <uint16_t Version>
struct campaign_state;

template <>
struct campaign_state<1> final {
  uint16_t version{1};
  address_t hooks{};
  campaign_status_t status{campaign_status_t::inactive};
};

using campaign_state_t = campaign_state<1>;

}  // namespace flywheel::schema
