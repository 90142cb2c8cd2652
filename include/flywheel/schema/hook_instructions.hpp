#pragma once
#include <flywheel/schema/payout.hpp>

#include <vector>

// Schema types: callback results returned by campaign hooks to the engine.
namespace flywheel::schema {

struct allocate_instructions_t final {
  std::vector<allocation_t> allocations;
  /// Fee reservations recorded alongside the payout allocations.
  std::vector<distribution_t> fees;
};

struct distribute_instructions_t final {
  std::vector<distribution_t> distributions;
  std::vector<distribution_t> fees;
  bool send_fees_now{};
};

struct send_instructions_t final {
  std::vector<payout_t> payouts;
  std::vector<distribution_t> fees;
  bool send_fees_now{};
};

}  // namespace flywheel::schema
