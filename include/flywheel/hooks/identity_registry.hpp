#pragma once

#include <flywheel/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace flywheel::hooks {

/// Read side of an external identity registry that maps referral codes to
/// payout addresses.
class identity_registry {
 public:
  virtual ~identity_registry() = default;

  virtual bool is_registered(std::string_view code) const = 0;
  virtual std::optional<flywheel::schema::address_t> payout_address(
      std::string_view code) const = 0;
};

}  // namespace flywheel::hooks
