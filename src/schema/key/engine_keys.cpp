#include <flywheel/schema/key/builder.hpp>
#include <flywheel/schema/key/engine_keys.hpp>

namespace flywheel::schema::key {

const std::string_view kCampaignKeyPrefix{"FW|STATE|CAMPAIGN|"};
const std::string_view kPayoutAllocationKeyPrefix{"FW|STATE|PAYOUT|"};
const std::string_view kFeeAllocationKeyPrefix{"FW|STATE|FEE|"};
const std::string_view kTotalPayoutsKeyPrefix{"FW|STATE|TOTAL_PAYOUTS|"};
const std::string_view kTotalFeesKeyPrefix{"FW|STATE|TOTAL_FEES|"};
const std::string_view kBalanceKeyPrefix{"FW|STATE|BALANCE|"};
const std::string_view kEventPrefix{"FW|EVENT|"};
const std::string_view kEventSequenceKey{"FW|SYS|EVENT_SEQ"};

const std::array<std::string_view, 8> kEngineKeyspaces{
    kCampaignKeyPrefix,    kPayoutAllocationKeyPrefix,
    kFeeAllocationKeyPrefix, kTotalPayoutsKeyPrefix,
    kTotalFeesKeyPrefix,   kBalanceKeyPrefix,
    kEventPrefix,          kEventSequenceKey};

flywheel::schema::bytes_t make_campaign_key(
    const flywheel::schema::address_t& campaign) {
  return builder{}.write(kCampaignKeyPrefix).write(campaign).data;
}

flywheel::schema::bytes_t make_payout_allocation_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset,
    const flywheel::schema::hash32_t& key) {
  return builder{}
      .write(kPayoutAllocationKeyPrefix)
      .write(campaign)
      .write(asset)
      .write(key)
      .data;
}

flywheel::schema::bytes_t make_fee_allocation_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset,
    const flywheel::schema::hash32_t& key) {
  return builder{}
      .write(kFeeAllocationKeyPrefix)
      .write(campaign)
      .write(asset)
      .write(key)
      .data;
}

flywheel::schema::bytes_t make_total_payouts_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset) {
  return builder{}
      .write(kTotalPayoutsKeyPrefix)
      .write(campaign)
      .write(asset)
      .data;
}

flywheel::schema::bytes_t make_total_fees_key(
    const flywheel::schema::address_t& campaign,
    const flywheel::schema::address_t& asset) {
  return builder{}.write(kTotalFeesKeyPrefix).write(campaign).write(asset).data;
}

flywheel::schema::bytes_t make_balance_key(
    const flywheel::schema::address_t& asset,
    const flywheel::schema::address_t& holder) {
  return builder{}.write(kBalanceKeyPrefix).write(asset).write(holder).data;
}

flywheel::schema::bytes_t make_event_key(const uint64_t sequence) {
  return builder{}.write(kEventPrefix).write(sequence).data;
}

}  // namespace flywheel::schema::key
