#pragma once

#include <flywheel/hooks/campaign_hooks.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace flywheel::hooks {

inline constexpr auto kSimpleRewardsCodespace =
    std::string_view{"flywheel.hooks.simple_rewards"};

enum class simple_rewards_error : uint32_t {
  unknown_campaign = 100,
  invalid_status_transition = 101,
  attribution_window_open = 102,
};

/// Creation payload.
template <uint16_t Version>
struct simple_rewards_config;

template <>
struct simple_rewards_config<1> final {
  uint16_t version{1};
  /// May withdraw funds and always drive status.
  flywheel::schema::address_t owner{};
  /// Directs every payout operation.
  flywheel::schema::address_t manager{};
  std::string uri;
  /// Delay between FINALIZING and the earliest manager-driven FINALIZED.
  flywheel::schema::duration_milliseconds_t attribution_window{};
};

using simple_rewards_config_t = simple_rewards_config<1>;

/// Manager-directed payouts.
///
/// The manager passes SCALE encoded instruction vectors which are forwarded
/// to the engine unchanged. Payloads:
///   allocate, deallocate     -> std::vector<allocation_t>
///   distribute, fees         -> std::vector<distribution_t>
///   send                     -> std::vector<payout_t>
///   withdraw_funds           -> payout_t
///   update_metadata          -> std::string (new uri, empty keeps the old)
class simple_rewards final : public campaign_hooks {
 public:
  simple_rewards(flywheel::schema::address_t address,
                 flywheel::schema::address_t engine);

  std::string campaign_uri(
      const flywheel::schema::address_t& campaign) const override;

  std::optional<simple_rewards_config_t> config(
      const flywheel::schema::address_t& campaign) const;
  std::optional<flywheel::schema::timestamp_milliseconds_t> finalize_after(
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
  struct campaign_record final {
    simple_rewards_config_t config;
    std::optional<flywheel::schema::timestamp_milliseconds_t> finalize_after;
  };

  campaign_record& record(const flywheel::schema::address_t& campaign);
  const campaign_record& require_manager(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign);

  mutable std::mutex mutex_;
  std::map<flywheel::schema::address_t, campaign_record> campaigns_;
};

}  // namespace flywheel::hooks
