#pragma once

#include <flywheel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: campaign status.
// Campaign lifecycle enum. FINALIZED is terminal and FINALIZING may only
// advance to FINALIZED.
namespace flywheel::schema {

enum class campaign_status_t : uint8_t {
  inactive = 0,
  active = 1,
  finalizing = 2,
  finalized = 3
};

inline constexpr auto kCampaignStatusMappings = enum_mappings_t<campaign_status_t, 4>{
    std::pair<std::string_view, campaign_status_t>{
        "inactive", campaign_status_t::inactive},
    std::pair<std::string_view, campaign_status_t>{"active",
                                                   campaign_status_t::active},
    std::pair<std::string_view, campaign_status_t>{
        "finalizing", campaign_status_t::finalizing},
    std::pair<std::string_view, campaign_status_t>{
        "finalized", campaign_status_t::finalized}};

template <>
inline std::optional<campaign_status_t> try_from_string<campaign_status_t>(
    const std::string_view value) {
  return from_string(value, kCampaignStatusMappings);
}

inline constexpr std::string_view to_string(const campaign_status_t value) {
  return to_string(value, kCampaignStatusMappings).value_or("unknown");
}

/// Ledger-level transition rule, applied before the campaign's hooks get a
/// chance to impose their own constraints.
inline constexpr bool is_valid_transition(const campaign_status_t from,
                                          const campaign_status_t to) {
  if (from == to || from == campaign_status_t::finalized) {
    return false;
  }
  if (from == campaign_status_t::finalizing) {
    return to == campaign_status_t::finalized;
  }
  return true;
}

/// Allocation, distribution and sends are only accepted in these states.
inline constexpr bool is_accepting_payouts(const campaign_status_t status) {
  return status == campaign_status_t::active ||
         status == campaign_status_t::finalizing;
}

}  // namespace flywheel::schema
