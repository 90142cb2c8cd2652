#include <flywheel/hooks/payload.hpp>
#include <flywheel/hooks/simple_rewards.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace flywheel::schema;

namespace flywheel::hooks {

namespace {

[[noreturn]] void reject(const simple_rewards_error code,
                         const std::string& message) {
  throw hook_error{std::string{kSimpleRewardsCodespace},
                   static_cast<uint32_t>(code), message};
}

}  // namespace

simple_rewards::simple_rewards(address_t address, address_t engine)
    : campaign_hooks{std::move(address), std::move(engine)} {}

std::string simple_rewards::campaign_uri(const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = campaigns_.find(campaign);
  return it == std::end(campaigns_) ? std::string{} : it->second.config.uri;
}

std::optional<simple_rewards_config_t> simple_rewards::config(
    const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = campaigns_.find(campaign);
  if (it == std::end(campaigns_)) {
    return std::nullopt;
  }
  return it->second.config;
}

std::optional<timestamp_milliseconds_t> simple_rewards::finalize_after(
    const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = campaigns_.find(campaign);
  if (it == std::end(campaigns_)) {
    return std::nullopt;
  }
  return it->second.finalize_after;
}

simple_rewards::campaign_record& simple_rewards::record(
    const address_t& campaign) {
  auto it = campaigns_.find(campaign);
  if (it == std::end(campaigns_)) {
    reject(simple_rewards_error::unknown_campaign,
           "campaign " + to_hex(campaign) + " was not created by these hooks");
  }
  return it->second;
}

const simple_rewards::campaign_record& simple_rewards::require_manager(
    const call_context_t& context,
    const address_t& campaign) {
  const auto& found = record(campaign);
  if (context.sender != found.config.manager) {
    throw hook_error{hook_error_code::unauthorized,
                     "sender is not the campaign manager"};
  }
  return found;
}

void simple_rewards::handle_create_campaign(const call_context_t&,
                                            const address_t& campaign,
                                            const nonce_t&,
                                            const bytes_view_t& hook_data) {
  auto config = decode_payload<simple_rewards_config_t>(hook_data, "create");
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("simple_rewards campaign {} owner {} manager {}",
               to_hex(campaign), to_hex(config.owner), to_hex(config.manager));
  campaigns_[campaign] = campaign_record{std::move(config), std::nullopt};
}

void simple_rewards::handle_update_status(const call_context_t& context,
                                          const address_t& campaign,
                                          const campaign_status_t old_status,
                                          const campaign_status_t new_status,
                                          const bytes_view_t&) {
  auto lock = std::scoped_lock{mutex_};
  auto& found = record(campaign);
  auto is_owner = context.sender == found.config.owner;
  if (!is_owner && context.sender != found.config.manager) {
    throw hook_error{hook_error_code::unauthorized,
                     "sender is neither campaign owner nor manager"};
  }
  if (old_status == campaign_status_t::active &&
      new_status == campaign_status_t::inactive) {
    reject(simple_rewards_error::invalid_status_transition,
           "an active campaign cannot be deactivated");
  }
  if (new_status == campaign_status_t::finalizing) {
    found.finalize_after =
        context.block_time + found.config.attribution_window;
    return;
  }
  if (new_status == campaign_status_t::finalized && !is_owner &&
      found.finalize_after && context.block_time < *found.finalize_after) {
    reject(simple_rewards_error::attribution_window_open,
           "attribution window closes at " +
               std::to_string(*found.finalize_after));
  }
}

void simple_rewards::handle_update_metadata(const call_context_t& context,
                                            const address_t& campaign,
                                            const bytes_view_t& hook_data) {
  auto uri = decode_payload<std::string>(hook_data, "update_metadata");
  auto lock = std::scoped_lock{mutex_};
  require_manager(context, campaign);
  if (!uri.empty()) {
    record(campaign).config.uri = std::move(uri);
  }
}

allocate_instructions_t simple_rewards::handle_allocate(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  {
    auto lock = std::scoped_lock{mutex_};
    require_manager(context, campaign);
  }
  return allocate_instructions_t{
      decode_payload<std::vector<allocation_t>>(hook_data, "allocate"), {}};
}

std::vector<allocation_t> simple_rewards::handle_deallocate(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  {
    auto lock = std::scoped_lock{mutex_};
    require_manager(context, campaign);
  }
  return decode_payload<std::vector<allocation_t>>(hook_data, "deallocate");
}

distribute_instructions_t simple_rewards::handle_distribute(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  {
    auto lock = std::scoped_lock{mutex_};
    require_manager(context, campaign);
  }
  return distribute_instructions_t{
      decode_payload<std::vector<distribution_t>>(hook_data, "distribute"),
      {},
      false};
}

send_instructions_t simple_rewards::handle_send(const call_context_t& context,
                                                const address_t& campaign,
                                                const address_t&,
                                                const bytes_view_t& hook_data) {
  {
    auto lock = std::scoped_lock{mutex_};
    require_manager(context, campaign);
  }
  return send_instructions_t{
      decode_payload<std::vector<payout_t>>(hook_data, "send"), {}, false};
}

std::vector<distribution_t> simple_rewards::handle_distribute_fees(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  {
    auto lock = std::scoped_lock{mutex_};
    require_manager(context, campaign);
  }
  return decode_payload<std::vector<distribution_t>>(hook_data,
                                                     "distribute_fees");
}

payout_t simple_rewards::handle_withdraw_funds(const call_context_t& context,
                                               const address_t& campaign,
                                               const address_t&,
                                               const bytes_view_t& hook_data) {
  {
    auto lock = std::scoped_lock{mutex_};
    if (context.sender != record(campaign).config.owner) {
      throw hook_error{hook_error_code::unauthorized,
                       "only the campaign owner may withdraw"};
    }
  }
  return decode_payload<payout_t>(hook_data, "withdraw_funds");
}

}  // namespace flywheel::hooks
