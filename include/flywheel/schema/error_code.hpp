#pragma once

#include <flywheel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace flywheel::schema {

inline constexpr auto kEngineCodespace = std::string_view{"flywheel.engine"};

enum class error_code : uint32_t {
  campaign_does_not_exist = 1,
  invalid_campaign_status = 2,
  insufficient_campaign_funds = 3,
  send_failed = 4,
  zero_amount = 5,
  unauthorized = 6,
  insufficient_allocation = 7,
  hooks_not_registered = 8,
  amount_overflow = 9,
  hook_failure = 10,
};

inline constexpr auto kErrorCodeMappings = enum_mappings_t<error_code, 10>{
    std::pair<std::string_view, error_code>{
        "campaign_does_not_exist", error_code::campaign_does_not_exist},
    std::pair<std::string_view, error_code>{
        "invalid_campaign_status", error_code::invalid_campaign_status},
    std::pair<std::string_view, error_code>{
        "insufficient_campaign_funds", error_code::insufficient_campaign_funds},
    std::pair<std::string_view, error_code>{"send_failed",
                                            error_code::send_failed},
    std::pair<std::string_view, error_code>{"zero_amount",
                                            error_code::zero_amount},
    std::pair<std::string_view, error_code>{"unauthorized",
                                            error_code::unauthorized},
    std::pair<std::string_view, error_code>{
        "insufficient_allocation", error_code::insufficient_allocation},
    std::pair<std::string_view, error_code>{
        "hooks_not_registered", error_code::hooks_not_registered},
    std::pair<std::string_view, error_code>{"amount_overflow",
                                            error_code::amount_overflow},
    std::pair<std::string_view, error_code>{"hook_failure",
                                            error_code::hook_failure}};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace flywheel::schema
