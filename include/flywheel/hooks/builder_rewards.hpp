#pragma once

#include <flywheel/hooks/campaign_hooks.hpp>
#include <flywheel/hooks/identity_registry.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace flywheel::hooks {

inline constexpr auto kBuilderRewardsCodespace =
    std::string_view{"flywheel.hooks.builder_rewards"};

enum class builder_rewards_error : uint32_t {
  unknown_campaign = 100,
  unregistered_code = 101,
  invalid_fee = 102,
};

inline constexpr auto kMaxFeeBasisPoints = uint16_t{10'000};

/// Creation payload.
template <uint16_t Version>
struct builder_rewards_config;

template <>
struct builder_rewards_config<1> final {
  uint16_t version{1};
  flywheel::schema::address_t manager{};
  /// Fee taken on every send, in basis points of the sent total.
  uint16_t fee_bps{};
  flywheel::schema::address_t fee_recipient{};
  std::string uri;
};

using builder_rewards_config_t = builder_rewards_config<1>;

/// One payout addressed by builder code.
template <uint16_t Version>
struct builder_payout;

template <>
struct builder_payout<1> final {
  uint16_t version{1};
  std::string code;
  flywheel::schema::amount_t amount{};
  flywheel::schema::bytes_t extra_data;
};

using builder_payout_t = builder_payout<1>;

/// Ledger key used for a builder code's allocations.
flywheel::schema::hash32_t make_builder_key(std::string_view code);

/// Builder-code rewards.
///
/// Payout, allocate, deallocate and distribute payloads are SCALE encoded
/// `std::vector<builder_payout_t>`. Codes are resolved to payout addresses
/// through the identity registry when funds move, so a builder may rotate
/// its address between allocation and distribution. Every send reserves
/// `fee_bps` of its total against the fee recipient's key; the fee recipient
/// or manager later settles it through distribute_fees with a SCALE encoded
/// `amount_t`.
class builder_rewards final : public campaign_hooks {
 public:
  builder_rewards(flywheel::schema::address_t address,
                  flywheel::schema::address_t engine,
                  std::shared_ptr<const identity_registry> registry);

  std::string campaign_uri(
      const flywheel::schema::address_t& campaign) const override;

  std::optional<builder_rewards_config_t> config(
      const flywheel::schema::address_t& campaign) const;

 protected:
  void handle_create_campaign(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::nonce_t& nonce,
      const flywheel::schema::bytes_view_t& hook_data) override;

  void handle_update_status(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      flywheel::schema::campaign_status_t old_status,
      flywheel::schema::campaign_status_t new_status,
      const flywheel::schema::bytes_view_t& hook_data) override;

  void handle_update_metadata(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::bytes_view_t& hook_data) override;

  flywheel::schema::allocate_instructions_t handle_allocate(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data) override;

  std::vector<flywheel::schema::allocation_t> handle_deallocate(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data) override;

  flywheel::schema::distribute_instructions_t handle_distribute(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data) override;

  flywheel::schema::send_instructions_t handle_send(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data) override;

  std::vector<flywheel::schema::distribution_t> handle_distribute_fees(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data) override;

  flywheel::schema::payout_t handle_withdraw_funds(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data) override;

 private:
  builder_rewards_config_t require_manager(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign) const;
  builder_rewards_config_t lookup(
      const flywheel::schema::address_t& campaign) const;
  flywheel::schema::address_t resolve(std::string_view code) const;

  std::shared_ptr<const identity_registry> registry_;
  mutable std::mutex mutex_;
  std::map<flywheel::schema::address_t, builder_rewards_config_t> campaigns_;
};

}  // namespace flywheel::hooks
