#pragma once

#include <flywheel/assets/asset_book.hpp>
#include <flywheel/schema/primitives.hpp>

namespace flywheel::vault {

/// Fund holder for one campaign.
///
/// The vault address is the campaign address. It moves funds only when its
/// controller asks, one asset per call, and has no bookkeeping of its own
/// beyond the balances recorded in the asset book.
class vault final {
 public:
  vault(flywheel::schema::address_t address,
        flywheel::schema::address_t controller,
        flywheel::assets::asset_book& assets);

  /// Attempt a transfer. Throws `ledger_error(unauthorized)` for any caller
  /// other than the controller; every transfer failure, including a
  /// reverting token or receiver, is reported as `false`.
  bool send_tokens(const flywheel::schema::address_t& caller,
                   const flywheel::schema::address_t& asset,
                   const flywheel::schema::address_t& recipient,
                   const flywheel::schema::amount_t& amount);

  flywheel::schema::amount_t balance(
      const flywheel::schema::address_t& asset) const;

  const flywheel::schema::address_t& address() const { return address_; }
  const flywheel::schema::address_t& controller() const { return controller_; }

 private:
  flywheel::schema::address_t address_;
  flywheel::schema::address_t controller_;
  flywheel::assets::asset_book& assets_;
};

}  // namespace flywheel::vault
