#pragma once

#include <flywheel/hooks/identity_registry.hpp>

#include <map>
#include <mutex>
#include <string>

namespace flywheel::hooks {

/// In-memory identity registry.
class code_registry final : public identity_registry {
 public:
  /// Returns false if the code is already taken or empty.
  bool register_code(std::string_view code,
                     const flywheel::schema::address_t& payout_address);

  /// Returns false if the code is unknown.
  bool update_payout_address(std::string_view code,
                             const flywheel::schema::address_t& payout_address);

  bool is_registered(std::string_view code) const override;
  std::optional<flywheel::schema::address_t> payout_address(
      std::string_view code) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, flywheel::schema::address_t, std::less<>> codes_;
};

}  // namespace flywheel::hooks
