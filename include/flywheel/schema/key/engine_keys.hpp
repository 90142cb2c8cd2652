#pragma once
#include <flywheel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// RocksDB keyspace layout for campaign records, ledger counters, vault
// balances and the event log.
namespace flywheel::schema::key {

extern const std::string_view kCampaignKeyPrefix;
extern const std::string_view kPayoutAllocationKeyPrefix;
extern const std::string_view kFeeAllocationKeyPrefix;
extern const std::string_view kTotalPayoutsKeyPrefix;
extern const std::string_view kTotalFeesKeyPrefix;
extern const std::string_view kBalanceKeyPrefix;
extern const std::string_view kEventPrefix;
extern const std::string_view kEventSequenceKey;
extern const std::array<std::string_view, 8> kEngineKeyspaces;

flywheel::schema::bytes_t make_campaign_key(
    const flywheel::schema::address_t& campaign);

flywheel::schema::bytes_t make_payout_allocation_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset,
    const flywheel::schema::hash32_t& key);

flywheel::schema::bytes_t make_fee_allocation_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset,
    const flywheel::schema::hash32_t& key);

flywheel::schema::bytes_t make_total_payouts_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset);

flywheel::schema::bytes_t make_total_fees_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset);

flywheel::schema::bytes_t make_balance_key(
    const flywheel::schema::address_t& asset,
    const flywheel::schema::address_t& holder);

flywheel::schema::bytes_t make_event_key(uint64_t sequence);

}  // namespace flywheel::schema::key
