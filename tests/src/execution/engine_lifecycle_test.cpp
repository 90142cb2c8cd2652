#include <flywheel/execution/campaign_address.hpp>
#include <flywheel/execution/engine.hpp>
#include <flywheel/hooks/campaign_hooks.hpp>
#include <flywheel/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

namespace {

using flywheel::schema::campaign_status_t;
using flywheel::schema::error_code;
using flywheel::testing::ledger_fixture;
using flywheel::testing::make_address;

constexpr auto kOk = uint32_t{0};

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

flywheel::schema::bytes_view_t no_data() {
  return flywheel::schema::bytes_view_t{};
}

}  // namespace

TEST(engine_lifecycle, create_campaign_starts_inactive_and_emits_created) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_create"};
  auto& engine = fixture.engine();

  auto result = engine.create_campaign(
      make_address(1), flywheel::testing::scripted_hooks_address(),
      flywheel::schema::nonce_t{7}, no_data());
  ASSERT_EQ(result.code, kOk) << result.log;
  ASSERT_TRUE(result.campaign.has_value());
  ASSERT_EQ(result.events.size(), 1u);
  auto created =
      std::get<flywheel::schema::campaign_created_t>(result.events[0]);
  EXPECT_EQ(created.campaign, *result.campaign);
  EXPECT_EQ(created.hooks, flywheel::testing::scripted_hooks_address());

  EXPECT_TRUE(engine.campaign_exists(*result.campaign));
  EXPECT_EQ(engine.campaign_status(*result.campaign),
            campaign_status_t::inactive);
  EXPECT_EQ(engine.campaign_hooks(*result.campaign),
            flywheel::testing::scripted_hooks_address());
  EXPECT_EQ(engine.campaign_uri(*result.campaign), "ipfs://campaign");
  EXPECT_EQ(fixture.hooks().create_calls, 1);
  EXPECT_EQ(fixture.hooks().last_context.invoker,
            flywheel::testing::registry_address());
  EXPECT_EQ(fixture.hooks().last_context.sender, make_address(1));
}

TEST(engine_lifecycle, create_campaign_is_idempotent) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_idempotent"};
  auto& engine = fixture.engine();
  auto payload = flywheel::schema::bytes_t{0x01, 0x02};

  auto first = engine.create_campaign(
      make_address(1), flywheel::testing::scripted_hooks_address(),
      flywheel::schema::nonce_t{1}, flywheel::schema::make_bytes_view(payload));
  auto second = engine.create_campaign(
      make_address(2), flywheel::testing::scripted_hooks_address(),
      flywheel::schema::nonce_t{1}, flywheel::schema::make_bytes_view(payload));

  ASSERT_EQ(first.code, kOk);
  ASSERT_EQ(second.code, kOk);
  EXPECT_EQ(first.campaign, second.campaign);
  EXPECT_TRUE(second.events.empty());
  EXPECT_EQ(fixture.hooks().create_calls, 1);
  EXPECT_EQ(engine.last_event_sequence(), 1u);
}

TEST(engine_lifecycle, created_address_matches_prediction) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_predict"};
  auto payload = flywheel::schema::bytes_t{0xde, 0xad, 0xbe, 0xef};
  auto nonce = flywheel::schema::nonce_t{"123456789012345678901234567890"};

  auto predicted = flywheel::execution::predict_campaign_address(
      flywheel::testing::scripted_hooks_address(), nonce,
      flywheel::schema::make_bytes_view(payload));
  auto result = fixture.engine().create_campaign(
      make_address(1), flywheel::testing::scripted_hooks_address(), nonce,
      flywheel::schema::make_bytes_view(payload));

  ASSERT_EQ(result.code, kOk);
  EXPECT_EQ(result.campaign, predicted);
}

TEST(engine_lifecycle, create_with_unregistered_hooks_fails) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_unregistered"};
  auto result = fixture.engine().create_campaign(
      make_address(1), make_address(0x99), flywheel::schema::nonce_t{1},
      no_data());

  EXPECT_EQ(result.code, code_of(error_code::hooks_not_registered));
  EXPECT_EQ(result.codespace, "flywheel.engine");
  EXPECT_FALSE(result.campaign.has_value());
  EXPECT_EQ(fixture.engine().last_event_sequence(), 0u);
}

TEST(engine_lifecycle, hook_rejection_on_create_leaves_no_campaign) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_create_reject"};
  fixture.hooks().fail_with(
      flywheel::hooks::hook_error{"test.hooks", 42, "nope"});

  auto nonce = flywheel::schema::nonce_t{5};
  auto result = fixture.engine().create_campaign(
      make_address(1), flywheel::testing::scripted_hooks_address(), nonce,
      no_data());

  EXPECT_EQ(result.code, 42u);
  EXPECT_EQ(result.codespace, "test.hooks");
  EXPECT_EQ(result.log, "nope");
  EXPECT_TRUE(result.events.empty());
  auto predicted = flywheel::execution::predict_campaign_address(
      flywheel::testing::scripted_hooks_address(), nonce, no_data());
  EXPECT_FALSE(fixture.engine().campaign_exists(predicted));
}

TEST(engine_lifecycle, non_standard_throw_on_create_is_rolled_back) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_create_throw"};
  auto& engine = fixture.engine();
  fixture.hooks().on_call = [](const flywheel::hooks::call_context_t&) {
    throw 42;
  };

  auto nonce = flywheel::schema::nonce_t{6};
  auto result = engine.create_campaign(
      make_address(1), flywheel::testing::scripted_hooks_address(), nonce,
      no_data());
  EXPECT_EQ(result.code, code_of(error_code::hook_failure));
  EXPECT_EQ(result.codespace, "flywheel.engine");
  EXPECT_FALSE(result.campaign.has_value());
  EXPECT_TRUE(result.events.empty());

  auto predicted = flywheel::execution::predict_campaign_address(
      flywheel::testing::scripted_hooks_address(), nonce, no_data());
  EXPECT_FALSE(engine.campaign_exists(predicted));

  // A later successful call must not commit the failed creation.
  fixture.hooks().on_call = nullptr;
  fixture.create_campaign(7);
  EXPECT_FALSE(engine.campaign_exists(predicted));
  EXPECT_EQ(engine.last_event_sequence(), 1u);
}

TEST(engine_lifecycle, status_walks_forward_to_finalized) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_status"};
  auto& engine = fixture.engine();
  auto campaign = fixture.create_campaign();

  for (auto status : {campaign_status_t::active, campaign_status_t::finalizing,
                      campaign_status_t::finalized}) {
    auto result =
        engine.update_status(make_address(3), campaign, status, no_data());
    ASSERT_EQ(result.code, kOk) << result.log;
    ASSERT_EQ(result.events.size(), 1u);
    auto updated =
        std::get<flywheel::schema::campaign_status_updated_t>(result.events[0]);
    EXPECT_EQ(updated.new_status, status);
    EXPECT_EQ(updated.sender, make_address(3));
    EXPECT_EQ(engine.campaign_status(campaign), status);
  }
  EXPECT_EQ(fixture.hooks().status_calls, 3);
}

TEST(engine_lifecycle, finalized_is_terminal) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_terminal"};
  auto& engine = fixture.engine();
  auto campaign = fixture.create_campaign();
  ASSERT_EQ(engine
                .update_status(make_address(1), campaign,
                               campaign_status_t::finalized, no_data())
                .code,
            kOk);

  for (auto status : {campaign_status_t::inactive, campaign_status_t::active,
                      campaign_status_t::finalizing,
                      campaign_status_t::finalized}) {
    auto result =
        engine.update_status(make_address(1), campaign, status, no_data());
    EXPECT_EQ(result.code, code_of(error_code::invalid_campaign_status));
  }
  EXPECT_EQ(engine.campaign_status(campaign), campaign_status_t::finalized);
}

TEST(engine_lifecycle, finalizing_only_moves_to_finalized) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_finalizing"};
  auto& engine = fixture.engine();
  auto campaign = fixture.create_campaign();
  ASSERT_EQ(engine
                .update_status(make_address(1), campaign,
                               campaign_status_t::finalizing, no_data())
                .code,
            kOk);

  EXPECT_EQ(engine
                .update_status(make_address(1), campaign,
                               campaign_status_t::active, no_data())
                .code,
            code_of(error_code::invalid_campaign_status));
  EXPECT_EQ(engine
                .update_status(make_address(1), campaign,
                               campaign_status_t::inactive, no_data())
                .code,
            code_of(error_code::invalid_campaign_status));
  EXPECT_EQ(engine
                .update_status(make_address(1), campaign,
                               campaign_status_t::finalized, no_data())
                .code,
            kOk);
}

TEST(engine_lifecycle, no_op_transition_is_rejected_before_hooks) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_noop"};
  auto campaign = fixture.create_campaign();

  auto result = fixture.engine().update_status(
      make_address(1), campaign, campaign_status_t::inactive, no_data());

  EXPECT_EQ(result.code, code_of(error_code::invalid_campaign_status));
  EXPECT_EQ(fixture.hooks().status_calls, 0);
}

TEST(engine_lifecycle, hook_can_veto_status_change) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_veto"};
  auto campaign = fixture.create_campaign();
  fixture.hooks().fail_with(
      flywheel::hooks::hook_error{flywheel::hooks::hook_error_code::unauthorized,
                                  "not allowed"});

  auto result = fixture.engine().update_status(
      make_address(1), campaign, campaign_status_t::active, no_data());

  EXPECT_EQ(result.code, 2u);
  EXPECT_EQ(result.codespace, "flywheel.hooks");
  EXPECT_EQ(result.log, "not allowed");
  EXPECT_EQ(fixture.engine().campaign_status(campaign),
            campaign_status_t::inactive);
}

TEST(engine_lifecycle, unknown_campaign_is_reported) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_unknown"};
  auto& engine = fixture.engine();
  auto missing = make_address(0x55);
  auto asset = make_address(0x70);

  EXPECT_FALSE(engine.campaign_exists(missing));
  EXPECT_FALSE(engine.campaign_status(missing).has_value());
  EXPECT_FALSE(engine.campaign_uri(missing).has_value());
  EXPECT_EQ(engine
                .update_status(make_address(1), missing,
                               campaign_status_t::active, no_data())
                .code,
            code_of(error_code::campaign_does_not_exist));
  EXPECT_EQ(engine.allocate(make_address(1), missing, asset, no_data()).code,
            code_of(error_code::campaign_does_not_exist));
  EXPECT_EQ(
      engine.withdraw_funds(make_address(1), missing, asset, no_data()).code,
      code_of(error_code::campaign_does_not_exist));
  EXPECT_EQ(
      engine.distribute_fees(make_address(1), missing, asset, no_data()).code,
      code_of(error_code::campaign_does_not_exist));
}

TEST(engine_lifecycle, metadata_update_emits_uri_events) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_metadata"};
  auto campaign = fixture.create_campaign();
  fixture.hooks().uri = "ipfs://updated";

  auto result =
      fixture.engine().update_metadata(make_address(1), campaign, no_data());

  ASSERT_EQ(result.code, kOk);
  ASSERT_EQ(result.events.size(), 2u);
  auto metadata =
      std::get<flywheel::schema::campaign_metadata_updated_t>(result.events[0]);
  EXPECT_EQ(metadata.uri, "ipfs://updated");
  EXPECT_TRUE(std::holds_alternative<flywheel::schema::contract_uri_updated_t>(
      result.events[1]));
}

TEST(engine_lifecycle, metadata_update_rejected_once_finalized) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_metadata_final"};
  auto campaign = fixture.create_campaign();
  ASSERT_EQ(fixture.engine()
                .update_status(make_address(1), campaign,
                               campaign_status_t::finalized, no_data())
                .code,
            kOk);

  auto result =
      fixture.engine().update_metadata(make_address(1), campaign, no_data());
  EXPECT_EQ(result.code, code_of(error_code::invalid_campaign_status));
}

TEST(engine_lifecycle, register_hooks_rejects_foreign_binding) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_foreign"};
  auto foreign = std::make_shared<flywheel::testing::scripted_hooks>(
      make_address(0x42), make_address(0x43));

  EXPECT_THROW(fixture.engine().register_hooks(foreign), std::invalid_argument);
  EXPECT_THROW(fixture.engine().register_hooks(nullptr), std::invalid_argument);
}

TEST(engine_lifecycle, events_are_sequenced_and_queryable) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_events"};
  auto& engine = fixture.engine();
  engine.set_block_time(1'000);
  auto campaign = fixture.create_campaign();
  engine.set_block_time(2'000);
  ASSERT_EQ(engine
                .update_status(make_address(1), campaign,
                               campaign_status_t::active, no_data())
                .code,
            kOk);

  auto all = engine.events(1, UINT64_MAX);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].sequence, 1u);
  EXPECT_EQ(all[0].recorded_at, 1'000u);
  EXPECT_TRUE(std::holds_alternative<flywheel::schema::campaign_created_t>(
      all[0].event));
  EXPECT_EQ(all[1].sequence, 2u);
  EXPECT_EQ(all[1].recorded_at, 2'000u);

  auto second = engine.events(2, 2);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_TRUE(
      std::holds_alternative<flywheel::schema::campaign_status_updated_t>(
          second[0].event));
  EXPECT_TRUE(engine.events(3, 10).empty());
}

TEST(engine_lifecycle, event_window_in_the_middle_of_the_log) {
  auto fixture = ledger_fixture{"flywheel_lifecycle_event_window"};
  auto& engine = fixture.engine();
  for (auto nonce = uint64_t{1}; nonce <= 5; ++nonce) {
    fixture.create_campaign(nonce);
  }
  ASSERT_EQ(engine.last_event_sequence(), 5u);

  auto window = engine.events(2, 4);
  ASSERT_EQ(window.size(), 3u);
  EXPECT_EQ(window.front().sequence, 2u);
  EXPECT_EQ(window.back().sequence, 4u);
  EXPECT_EQ(engine.events(0, 1).size(), 1u);
  EXPECT_EQ(engine.events(5, UINT64_MAX).size(), 1u);
  EXPECT_TRUE(engine.events(4, 2).empty());
  EXPECT_TRUE(engine.events(6, UINT64_MAX).empty());
}

TEST(engine_lifecycle, state_survives_reopen) {
  auto db = flywheel::testing::make_db_path("flywheel_lifecycle_reopen");
  auto asset = make_address(0x70);
  auto key = flywheel::testing::make_hash(9);
  auto campaign = flywheel::schema::address_t{};

  {
    auto storage = flywheel::storage::make_storage<
        flywheel::storage::rocksdb_storage_tag>(db);
    auto engine = flywheel::execution::engine{
        storage, flywheel::execution::engine_options_t{
                     .address = flywheel::testing::registry_address(),
                     .db_path = db}};
    auto hooks = std::make_shared<flywheel::testing::scripted_hooks>(
        flywheel::testing::scripted_hooks_address(),
        flywheel::testing::registry_address());
    engine.register_hooks(hooks);

    auto created = engine.create_campaign(
        make_address(1), flywheel::testing::scripted_hooks_address(),
        flywheel::schema::nonce_t{1}, no_data());
    ASSERT_EQ(created.code, kOk);
    campaign = *created.campaign;
    ASSERT_EQ(engine
                  .update_status(make_address(1), campaign,
                                 campaign_status_t::active, no_data())
                  .code,
              kOk);
    engine.fund(asset, campaign, 500);
    hooks->allocate_result.allocations.push_back(
        flywheel::schema::allocation_t{.key = key, .amount = 200});
    ASSERT_EQ(engine.allocate(make_address(1), campaign, asset, no_data()).code,
              kOk);
  }

  {
    auto storage = flywheel::storage::make_storage<
        flywheel::storage::rocksdb_storage_tag>(db);
    auto engine = flywheel::execution::engine{
        storage, flywheel::execution::engine_options_t{
                     .address = flywheel::testing::registry_address(),
                     .db_path = db}};

    EXPECT_TRUE(engine.campaign_exists(campaign));
    EXPECT_EQ(engine.campaign_status(campaign), campaign_status_t::active);
    EXPECT_EQ(engine.balance_of(asset, campaign), 500);
    EXPECT_EQ(engine.total_allocated_payouts(campaign, asset), 200);
    EXPECT_EQ(engine.allocated_payout(campaign, asset, key), 200);
    EXPECT_EQ(engine.last_event_sequence(), 3u);
    EXPECT_EQ(engine.events(1, UINT64_MAX).size(), 3u);

    // Hooks are not persisted; operations need them registered again.
    EXPECT_EQ(engine.allocate(make_address(1), campaign, asset, no_data()).code,
              code_of(error_code::hooks_not_registered));
  }

  flywheel::testing::remove_path(db);
}
