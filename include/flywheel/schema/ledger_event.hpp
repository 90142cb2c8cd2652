#pragma once

#include <flywheel/schema/campaign_status.hpp>
#include <flywheel/schema/primitives.hpp>

#include <string>
#include <string_view>
#include <variant>

// Schema type: ledger event.
// System-of-record events; every committed state change emits exactly one,
// carrying enough fields to reconstruct the ledger delta.
namespace flywheel::schema {

struct campaign_created_t final {
  address_t campaign{};
  address_t hooks{};
};

struct campaign_status_updated_t final {
  address_t campaign{};
  address_t sender{};
  campaign_status_t old_status{};
  campaign_status_t new_status{};
};

struct campaign_metadata_updated_t final {
  address_t campaign{};
  std::string uri;
};

/// Content URI change notification for indexers.
struct contract_uri_updated_t final {
  address_t campaign{};
};

struct payout_allocated_t final {
  address_t campaign{};
  address_t asset{};
  hash32_t key{};
  amount_t amount{};
  bytes_t extra_data;
};

struct payouts_deallocated_t final {
  address_t campaign{};
  address_t asset{};
  hash32_t key{};
  amount_t amount{};
  bytes_t extra_data;
};

struct payout_sent_t final {
  address_t campaign{};
  address_t asset{};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

struct payouts_distributed_t final {
  address_t campaign{};
  address_t asset{};
  hash32_t key{};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

struct fee_sent_t final {
  address_t campaign{};
  address_t asset{};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

struct fee_allocated_t final {
  address_t campaign{};
  address_t asset{};
  hash32_t key{};
  amount_t amount{};
  bytes_t extra_data;
};

struct fee_transfer_failed_t final {
  address_t campaign{};
  address_t asset{};
  hash32_t key{};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

struct fees_distributed_t final {
  address_t campaign{};
  address_t asset{};
  hash32_t key{};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

struct funds_withdrawn_t final {
  address_t campaign{};
  address_t asset{};
  address_t recipient{};
  amount_t amount{};
  bytes_t extra_data;
};

using ledger_event_t = std::variant<campaign_created_t,
                                    campaign_status_updated_t,
                                    campaign_metadata_updated_t,
                                    contract_uri_updated_t,
                                    payout_allocated_t,
                                    payouts_deallocated_t,
                                    payout_sent_t,
                                    payouts_distributed_t,
                                    fee_sent_t,
                                    fee_allocated_t,
                                    fee_transfer_failed_t,
                                    fees_distributed_t,
                                    funds_withdrawn_t>;

/// Persisted event log row.
template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t recorded_at{};
  ledger_event_t event;
};

using event_record_t = event_record<1>;

std::string_view event_name(const ledger_event_t& event);

}  // namespace flywheel::schema
