#include <flywheel/schema/encoding/scale/encoder.hpp>
#include <flywheel/schema/ledger_event.hpp>
#include <flywheel/schema/transaction_event.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <variant>

namespace {

const flywheel::schema::transaction_event_attribute_t* find_attribute(
    const flywheel::schema::transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return &attribute;
    }
  }
  return nullptr;
}

}  // namespace

TEST(transaction_event, payout_distributed_flattens_fields) {
  auto campaign = flywheel::schema::address_t{};
  campaign[19] = 0x01;
  auto event = flywheel::schema::ledger_event_t{
      flywheel::schema::payouts_distributed_t{.campaign = campaign,
                                              .amount = 400}};

  auto flat = flywheel::schema::to_transaction_event(event);
  EXPECT_EQ(flat.type, "payouts_distributed");

  auto* campaign_attribute = find_attribute(flat, "campaign");
  ASSERT_NE(campaign_attribute, nullptr);
  EXPECT_EQ(campaign_attribute->value,
            flywheel::schema::to_hex(campaign));
  EXPECT_TRUE(campaign_attribute->index);

  auto* amount = find_attribute(flat, "amount");
  ASSERT_NE(amount, nullptr);
  EXPECT_EQ(amount->value, "400");
  EXPECT_FALSE(amount->index);
  EXPECT_EQ(find_attribute(flat, "extra_data"), nullptr);
}

TEST(transaction_event, status_update_uses_status_names) {
  auto event = flywheel::schema::ledger_event_t{
      flywheel::schema::campaign_status_updated_t{
          .old_status = flywheel::schema::campaign_status_t::active,
          .new_status = flywheel::schema::campaign_status_t::finalizing}};

  auto flat = flywheel::schema::to_transaction_event(event);
  EXPECT_EQ(flat.type, "campaign_status_updated");
  ASSERT_NE(find_attribute(flat, "new_status"), nullptr);
  EXPECT_EQ(find_attribute(flat, "old_status")->value, "active");
  EXPECT_EQ(find_attribute(flat, "new_status")->value, "finalizing");
}

TEST(transaction_event, event_record_survives_scale_encoding) {
  auto record = flywheel::schema::event_record_t{
      .sequence = 9,
      .recorded_at = 1'700'000'000'000,
      .event = flywheel::schema::fee_transfer_failed_t{
          .amount = 12, .extra_data = flywheel::schema::bytes_t{0xCA, 0xFE}}};

  auto encoder = flywheel::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<flywheel::schema::event_record_t>(
      flywheel::schema::make_bytes_view(encoded));

  EXPECT_EQ(decoded.sequence, 9u);
  EXPECT_EQ(decoded.recorded_at, 1'700'000'000'000u);
  ASSERT_TRUE(
      std::holds_alternative<flywheel::schema::fee_transfer_failed_t>(
          decoded.event));
  auto& failed = std::get<flywheel::schema::fee_transfer_failed_t>(decoded.event);
  EXPECT_EQ(failed.amount, 12);
  EXPECT_EQ(failed.extra_data, (flywheel::schema::bytes_t{0xCA, 0xFE}));
}
