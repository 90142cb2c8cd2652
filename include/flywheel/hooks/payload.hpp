#pragma once

#include <flywheel/hooks/campaign_hooks.hpp>
#include <flywheel/schema/encoding/scale/encoder.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace flywheel::hooks {

/// Decode a SCALE hook payload, rejecting malformed bytes with
/// `hook_error_code::invalid_payload`.
template <typename T>
T decode_payload(const flywheel::schema::bytes_view_t& hook_data,
                 const std::string_view what) {
  auto encoder = flywheel::schema::encoding::scale_encoder_t{};
  auto decoded = encoder.try_decode<T>(hook_data);
  if (!decoded) {
    throw hook_error{hook_error_code::invalid_payload,
                     "malformed " + std::string{what} + " payload"};
  }
  return std::move(*decoded);
}

}  // namespace flywheel::hooks
