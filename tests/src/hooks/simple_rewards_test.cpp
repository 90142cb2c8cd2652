#include <flywheel/common/ledger_error.hpp>
#include <flywheel/execution/campaign_address.hpp>
#include <flywheel/hooks/simple_rewards.hpp>
#include <flywheel/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

using flywheel::hooks::simple_rewards;
using flywheel::hooks::simple_rewards_config_t;
using flywheel::hooks::simple_rewards_error;
using flywheel::schema::address_t;
using flywheel::schema::allocation_t;
using flywheel::schema::bytes_t;
using flywheel::schema::campaign_status_t;
using flywheel::schema::distribution_t;
using flywheel::schema::make_bytes_view;
using flywheel::schema::payout_t;
using flywheel::testing::encode;
using flywheel::testing::ledger_fixture;
using flywheel::testing::make_address;
using flywheel::testing::make_hash;

constexpr auto kOk = uint32_t{0};
constexpr auto kUnauthorized =
    static_cast<uint32_t>(flywheel::hooks::hook_error_code::unauthorized);

const auto kOwner = make_address(0x51);
const auto kManager = make_address(0x52);
const auto kStranger = make_address(0x53);
const auto kToken = make_address(0x70);

uint32_t code_of(const simple_rewards_error code) {
  return static_cast<uint32_t>(code);
}

class simple_rewards_harness final {
 public:
  explicit simple_rewards_harness(const std::string& db_prefix)
      : fixture_{db_prefix},
        hooks_{std::make_shared<simple_rewards>(
            make_address(0xB1), flywheel::testing::registry_address())} {
    fixture_.engine().register_hooks(hooks_);
  }

  flywheel::execution::engine& engine() { return fixture_.engine(); }
  simple_rewards& hooks() { return *hooks_; }

  address_t create(const uint64_t window = 0, const uint64_t nonce = 1) {
    auto payload = encode(simple_rewards_config_t{.owner = kOwner,
                                                  .manager = kManager,
                                                  .uri = "ipfs://rewards",
                                                  .attribution_window = window});
    auto result = engine().create_campaign(kOwner, hooks_->address(),
                                           flywheel::schema::nonce_t{nonce},
                                           make_bytes_view(payload));
    EXPECT_EQ(result.code, kOk) << result.log;
    return result.campaign.value_or(address_t{});
  }

  address_t create_active(const flywheel::schema::amount_t& funding) {
    auto campaign = create();
    EXPECT_EQ(set_status(kManager, campaign, campaign_status_t::active).code, kOk);
    engine().fund(kToken, campaign, funding);
    return campaign;
  }

  flywheel::schema::operation_result_t set_status(
      const address_t& sender,
      const address_t& campaign,
      const campaign_status_t status) {
    return engine().update_status(sender, campaign, status,
                                  flywheel::schema::bytes_view_t{});
  }

 private:
  ledger_fixture fixture_;
  std::shared_ptr<simple_rewards> hooks_;
};

}  // namespace

TEST(simple_rewards, create_records_config) {
  auto harness = simple_rewards_harness{"flywheel_simple_create"};
  auto campaign = harness.create(500);

  auto config = harness.hooks().config(campaign);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->owner, kOwner);
  EXPECT_EQ(config->manager, kManager);
  EXPECT_EQ(config->attribution_window, 500u);
  EXPECT_EQ(harness.engine().campaign_uri(campaign).value_or(""),
            "ipfs://rewards");
}

TEST(simple_rewards, malformed_create_payload_leaves_no_campaign) {
  auto harness = simple_rewards_harness{"flywheel_simple_bad_create"};
  auto payload = bytes_t{0x01};
  auto result = harness.engine().create_campaign(
      kOwner, harness.hooks().address(), flywheel::schema::nonce_t{1},
      make_bytes_view(payload));

  EXPECT_EQ(result.code, static_cast<uint32_t>(
                             flywheel::hooks::hook_error_code::invalid_payload));
  EXPECT_EQ(result.codespace, "flywheel.hooks");
  EXPECT_FALSE(harness.engine().campaign_exists(
      flywheel::execution::predict_campaign_address(
          harness.hooks().address(), flywheel::schema::nonce_t{1},
          make_bytes_view(payload))));
}

TEST(simple_rewards, manager_drives_allocation_and_distribution) {
  auto harness = simple_rewards_harness{"flywheel_simple_payouts"};
  auto& engine = harness.engine();
  auto campaign = harness.create_active(1'000);
  auto recipient = make_address(0x54);

  auto allocations = encode(std::vector<allocation_t>{
      allocation_t{.key = make_hash(1), .amount = 400}});
  ASSERT_EQ(engine
                .allocate(kManager, campaign, kToken,
                          make_bytes_view(allocations))
                .code,
            kOk);

  auto distributions = encode(std::vector<distribution_t>{distribution_t{
      .recipient = recipient, .key = make_hash(1), .amount = 400}});
  auto result = engine.distribute(kManager, campaign, kToken,
                                  make_bytes_view(distributions));
  ASSERT_EQ(result.code, kOk) << result.log;
  EXPECT_EQ(engine.balance_of(kToken, recipient), 400);
  EXPECT_EQ(engine.balance_of(kToken, campaign), 600);

  auto payouts = encode(std::vector<payout_t>{
      payout_t{.recipient = recipient, .amount = 100}});
  ASSERT_EQ(
      engine.send(kManager, campaign, kToken, make_bytes_view(payouts)).code,
      kOk);
  EXPECT_EQ(engine.balance_of(kToken, recipient), 500);
}

TEST(simple_rewards, only_manager_moves_payouts) {
  auto harness = simple_rewards_harness{"flywheel_simple_auth"};
  auto& engine = harness.engine();
  auto campaign = harness.create_active(100);
  auto allocations = encode(std::vector<allocation_t>{
      allocation_t{.key = make_hash(1), .amount = 10}});

  for (const auto& sender : {kOwner, kStranger}) {
    auto result = engine.allocate(sender, campaign, kToken,
                                  make_bytes_view(allocations));
    EXPECT_EQ(result.code, kUnauthorized);
    EXPECT_EQ(result.codespace, "flywheel.hooks");
  }
  EXPECT_EQ(harness.set_status(kStranger, campaign, campaign_status_t::finalizing)
                .code,
            kUnauthorized);
  EXPECT_EQ(engine.total_allocated_payouts(campaign, kToken), 0);
}

TEST(simple_rewards, only_owner_withdraws) {
  auto harness = simple_rewards_harness{"flywheel_simple_withdraw"};
  auto& engine = harness.engine();
  auto campaign = harness.create_active(100);
  auto payout = encode(payout_t{.recipient = kOwner, .amount = 40});

  EXPECT_EQ(engine
                .withdraw_funds(kManager, campaign, kToken,
                                make_bytes_view(payout))
                .code,
            kUnauthorized);
  auto result = engine.withdraw_funds(kOwner, campaign, kToken,
                                      make_bytes_view(payout));
  ASSERT_EQ(result.code, kOk) << result.log;
  EXPECT_EQ(engine.balance_of(kToken, kOwner), 40);
}

TEST(simple_rewards, active_campaign_cannot_be_deactivated) {
  auto harness = simple_rewards_harness{"flywheel_simple_deactivate"};
  auto campaign = harness.create_active(0);

  auto result = harness.set_status(kOwner, campaign, campaign_status_t::inactive);
  EXPECT_EQ(result.code,
            code_of(simple_rewards_error::invalid_status_transition));
  EXPECT_EQ(result.codespace, "flywheel.hooks.simple_rewards");
  EXPECT_EQ(harness.engine().campaign_status(campaign),
            campaign_status_t::active);
}

TEST(simple_rewards, manager_waits_for_attribution_window) {
  auto harness = simple_rewards_harness{"flywheel_simple_window"};
  auto& engine = harness.engine();
  auto campaign = harness.create(1'000);

  engine.set_block_time(5'000);
  ASSERT_EQ(harness.set_status(kManager, campaign, campaign_status_t::active).code,
            kOk);
  ASSERT_EQ(
      harness.set_status(kManager, campaign, campaign_status_t::finalizing).code,
      kOk);
  EXPECT_EQ(harness.hooks().finalize_after(campaign), 6'000u);

  engine.set_block_time(5'999);
  EXPECT_EQ(
      harness.set_status(kManager, campaign, campaign_status_t::finalized).code,
      code_of(simple_rewards_error::attribution_window_open));
  EXPECT_EQ(engine.campaign_status(campaign), campaign_status_t::finalizing);

  engine.set_block_time(6'000);
  EXPECT_EQ(
      harness.set_status(kManager, campaign, campaign_status_t::finalized).code,
      kOk);
}

TEST(simple_rewards, owner_may_finalize_early) {
  auto harness = simple_rewards_harness{"flywheel_simple_owner_finalize"};
  auto& engine = harness.engine();
  auto campaign = harness.create(1'000);

  engine.set_block_time(5'000);
  ASSERT_EQ(
      harness.set_status(kManager, campaign, campaign_status_t::finalizing).code,
      kOk);
  EXPECT_EQ(harness.set_status(kOwner, campaign, campaign_status_t::finalized).code,
            kOk);
}

TEST(simple_rewards, malformed_payload_is_rejected) {
  auto harness = simple_rewards_harness{"flywheel_simple_bad_payload"};
  auto campaign = harness.create_active(100);
  auto payload = bytes_t{0xFF, 0xFF};

  auto result = harness.engine().allocate(kManager, campaign, kToken,
                                          make_bytes_view(payload));
  EXPECT_EQ(result.code, static_cast<uint32_t>(
                             flywheel::hooks::hook_error_code::invalid_payload));
  EXPECT_EQ(result.log, "malformed allocate payload");
}

TEST(simple_rewards, metadata_update_replaces_uri) {
  auto harness = simple_rewards_harness{"flywheel_simple_metadata"};
  auto& engine = harness.engine();
  auto campaign = harness.create();

  auto uri = encode(std::string{"ipfs://updated"});
  auto result = engine.update_metadata(kManager, campaign, make_bytes_view(uri));
  ASSERT_EQ(result.code, kOk) << result.log;
  ASSERT_EQ(result.events.size(), 2u);
  auto updated = std::get<flywheel::schema::campaign_metadata_updated_t>(
      result.events[0]);
  EXPECT_EQ(updated.uri, "ipfs://updated");
  EXPECT_EQ(engine.campaign_uri(campaign).value_or(""), "ipfs://updated");

  auto empty = encode(std::string{});
  ASSERT_EQ(
      engine.update_metadata(kManager, campaign, make_bytes_view(empty)).code,
      kOk);
  EXPECT_EQ(engine.campaign_uri(campaign).value_or(""), "ipfs://updated");
}

TEST(simple_rewards, callbacks_reject_other_invokers) {
  auto hooks = simple_rewards{make_address(0xB1),
                              flywheel::testing::registry_address()};
  auto context = flywheel::hooks::call_context_t{.invoker = kStranger,
                                                 .sender = kManager};
  try {
    hooks.on_allocate(context, make_address(0x60), kToken,
                      flywheel::schema::bytes_view_t{});
    FAIL() << "expected ledger_error";
  } catch (const flywheel::common::ledger_error& ex) {
    EXPECT_EQ(ex.code(), flywheel::schema::error_code::unauthorized);
  }
}

TEST(simple_rewards, unknown_campaign_is_rejected) {
  auto hooks = simple_rewards{make_address(0xB1),
                              flywheel::testing::registry_address()};
  auto context = flywheel::hooks::call_context_t{
      .invoker = flywheel::testing::registry_address(), .sender = kManager};
  try {
    hooks.on_send(context, make_address(0x60), kToken,
                  flywheel::schema::bytes_view_t{});
    FAIL() << "expected hook_error";
  } catch (const flywheel::hooks::hook_error& ex) {
    EXPECT_EQ(ex.code(), code_of(simple_rewards_error::unknown_campaign));
    EXPECT_EQ(ex.codespace(), "flywheel.hooks.simple_rewards");
  }
}
