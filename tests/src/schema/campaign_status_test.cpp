#include <flywheel/schema/campaign_status.hpp>
#include <flywheel/schema/encoding/scale/encoder.hpp>
#include <gtest/gtest.h>

using flywheel::schema::campaign_status_t;
using flywheel::schema::is_valid_transition;

TEST(campaign_status, finalized_is_terminal) {
  for (auto to : {campaign_status_t::inactive, campaign_status_t::active,
                  campaign_status_t::finalizing, campaign_status_t::finalized}) {
    EXPECT_FALSE(is_valid_transition(campaign_status_t::finalized, to));
  }
}

TEST(campaign_status, finalizing_only_moves_to_finalized) {
  EXPECT_TRUE(is_valid_transition(campaign_status_t::finalizing,
                                  campaign_status_t::finalized));
  EXPECT_FALSE(is_valid_transition(campaign_status_t::finalizing,
                                   campaign_status_t::active));
  EXPECT_FALSE(is_valid_transition(campaign_status_t::finalizing,
                                   campaign_status_t::inactive));
}

TEST(campaign_status, same_status_is_not_a_transition) {
  EXPECT_FALSE(is_valid_transition(campaign_status_t::active,
                                   campaign_status_t::active));
  EXPECT_TRUE(is_valid_transition(campaign_status_t::active,
                                  campaign_status_t::inactive));
  EXPECT_TRUE(is_valid_transition(campaign_status_t::inactive,
                                  campaign_status_t::finalized));
}

TEST(campaign_status, payouts_accepted_while_running) {
  EXPECT_FALSE(flywheel::schema::is_accepting_payouts(campaign_status_t::inactive));
  EXPECT_TRUE(flywheel::schema::is_accepting_payouts(campaign_status_t::active));
  EXPECT_TRUE(
      flywheel::schema::is_accepting_payouts(campaign_status_t::finalizing));
  EXPECT_FALSE(
      flywheel::schema::is_accepting_payouts(campaign_status_t::finalized));
}

TEST(campaign_status, names_parse_back) {
  EXPECT_EQ(flywheel::schema::to_string(campaign_status_t::finalizing),
            "finalizing");
  EXPECT_EQ(flywheel::schema::try_from_string<campaign_status_t>("active"),
            campaign_status_t::active);
  EXPECT_FALSE(
      flywheel::schema::try_from_string<campaign_status_t>("paused").has_value());
}

TEST(campaign_status, scale_encodes_as_one_byte) {
  auto encoder = flywheel::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(campaign_status_t::finalized);
  ASSERT_EQ(encoded.size(), 1u);
  EXPECT_EQ(encoded[0], 3u);

  auto invalid = flywheel::schema::bytes_t{7};
  EXPECT_FALSE(encoder
                   .try_decode<campaign_status_t>(
                       flywheel::schema::make_bytes_view(invalid))
                   .has_value());
}
