#pragma once

#include <flywheel/schema/campaign_status.hpp>
#include <flywheel/schema/primitives.hpp>

#include <optional>

namespace flywheel::hooks {

/// Read-only ledger state handed to hooks for the duration of a callback.
///
/// Reads see the writes the current call has staged so far. The view is
/// only valid inside the callback it was passed to.
class ledger_view {
 public:
  virtual ~ledger_view() = default;

  virtual std::optional<flywheel::schema::campaign_status_t> campaign_status(
      const flywheel::schema::address_t& campaign) const = 0;

  virtual flywheel::schema::amount_t total_allocated_payouts(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset) const = 0;
  virtual flywheel::schema::amount_t total_allocated_fees(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset) const = 0;
  virtual flywheel::schema::amount_t allocated_payout(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::hash32_t& key) const = 0;
  virtual flywheel::schema::amount_t allocated_fee(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::hash32_t& key) const = 0;

  virtual flywheel::schema::amount_t balance_of(
      const flywheel::schema::address_t& asset,
      const flywheel::schema::address_t& holder) const = 0;
};

}  // namespace flywheel::hooks
