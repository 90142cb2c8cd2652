#pragma once
#include <flywheel/schema/primitives.hpp>

// Schema types: money movement instructions computed by campaign hooks.
namespace flywheel::schema {

/// Immediate transfer to a payable address.
template <uint16_t Version>
struct payout;

template <>
struct payout<1> final {
  uint16_t version{1};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

using payout_t = payout<1>;

/// Ledger reservation against an opaque recipient key.
template <uint16_t Version>
struct allocation;

template <>
struct allocation<1> final {
  uint16_t version{1};
  hash32_t key{};
  amount_t amount{};
  bytes_t extra_data;
};

using allocation_t = allocation<1>;

/// Transfer that settles (or reserves) against a recipient key.
template <uint16_t Version>
struct distribution;

template <>
struct distribution<1> final {
  uint16_t version{1};
  address_t recipient{};
  hash32_t key{};
  amount_t amount{};
  bytes_t extra_data;
};

using distribution_t = distribution<1>;

}  // namespace flywheel::schema
