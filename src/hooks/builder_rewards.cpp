#include <flywheel/blake3/hash.hpp>
#include <flywheel/hooks/builder_rewards.hpp>
#include <flywheel/hooks/payload.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace flywheel::schema;

namespace flywheel::hooks {

namespace {

[[noreturn]] void reject(const builder_rewards_error code,
                         const std::string& message) {
  throw hook_error{std::string{kBuilderRewardsCodespace},
                   static_cast<uint32_t>(code), message};
}

}  // namespace

hash32_t make_builder_key(const std::string_view code) {
  return flywheel::blake3::hash("flywheel.builder_code.v1",
                                make_bytes_view(code));
}

builder_rewards::builder_rewards(
    address_t address,
    address_t engine,
    std::shared_ptr<const identity_registry> registry)
    : campaign_hooks{std::move(address), std::move(engine)},
      registry_{std::move(registry)} {}

std::string builder_rewards::campaign_uri(const address_t& campaign) const {
  auto found = config(campaign);
  return found ? found->uri : std::string{};
}

std::optional<builder_rewards_config_t> builder_rewards::config(
    const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = campaigns_.find(campaign);
  if (it == std::end(campaigns_)) {
    return std::nullopt;
  }
  return it->second;
}

builder_rewards_config_t builder_rewards::lookup(
    const address_t& campaign) const {
  auto found = config(campaign);
  if (!found) {
    reject(builder_rewards_error::unknown_campaign,
           "campaign " + to_hex(campaign) + " was not created by these hooks");
  }
  return *found;
}

builder_rewards_config_t builder_rewards::require_manager(
    const call_context_t& context,
    const address_t& campaign) const {
  auto found = lookup(campaign);
  if (context.sender != found.manager) {
    throw hook_error{hook_error_code::unauthorized,
                     "sender is not the campaign manager"};
  }
  return found;
}

address_t builder_rewards::resolve(const std::string_view code) const {
  auto payout = registry_->payout_address(code);
  if (!payout) {
    reject(builder_rewards_error::unregistered_code,
           "builder code '" + std::string{code} + "' is not registered");
  }
  return *payout;
}

void builder_rewards::handle_create_campaign(const call_context_t&,
                                             const address_t& campaign,
                                             const nonce_t&,
                                             const bytes_view_t& hook_data) {
  auto config = decode_payload<builder_rewards_config_t>(hook_data, "create");
  if (config.fee_bps > kMaxFeeBasisPoints) {
    reject(builder_rewards_error::invalid_fee,
           "fee of " + std::to_string(config.fee_bps) +
               " basis points exceeds 100%");
  }
  spdlog::info("builder_rewards campaign {} manager {} fee {} bps",
               to_hex(campaign), to_hex(config.manager), config.fee_bps);
  auto lock = std::scoped_lock{mutex_};
  campaigns_[campaign] = std::move(config);
}

void builder_rewards::handle_update_status(const call_context_t& context,
                                           const address_t& campaign,
                                           campaign_status_t,
                                           campaign_status_t,
                                           const bytes_view_t&) {
  require_manager(context, campaign);
}

void builder_rewards::handle_update_metadata(const call_context_t& context,
                                             const address_t& campaign,
                                             const bytes_view_t& hook_data) {
  require_manager(context, campaign);
  auto uri = decode_payload<std::string>(hook_data, "update_metadata");
  if (uri.empty()) {
    return;
  }
  auto lock = std::scoped_lock{mutex_};
  campaigns_[campaign].uri = std::move(uri);
}

allocate_instructions_t builder_rewards::handle_allocate(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  require_manager(context, campaign);
  auto instructions = allocate_instructions_t{};
  for (auto& entry :
       decode_payload<std::vector<builder_payout_t>>(hook_data, "allocate")) {
    if (!registry_->is_registered(entry.code)) {
      reject(builder_rewards_error::unregistered_code,
             "builder code '" + entry.code + "' is not registered");
    }
    instructions.allocations.push_back(allocation_t{
        .key = make_builder_key(entry.code),
        .amount = entry.amount,
        .extra_data = std::move(entry.extra_data)});
  }
  return instructions;
}

std::vector<allocation_t> builder_rewards::handle_deallocate(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  require_manager(context, campaign);
  auto allocations = std::vector<allocation_t>{};
  for (auto& entry :
       decode_payload<std::vector<builder_payout_t>>(hook_data, "deallocate")) {
    allocations.push_back(
        allocation_t{.key = make_builder_key(entry.code),
                     .amount = entry.amount,
                     .extra_data = std::move(entry.extra_data)});
  }
  return allocations;
}

distribute_instructions_t builder_rewards::handle_distribute(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  require_manager(context, campaign);
  auto instructions = distribute_instructions_t{};
  for (auto& entry :
       decode_payload<std::vector<builder_payout_t>>(hook_data, "distribute")) {
    instructions.distributions.push_back(
        distribution_t{.recipient = resolve(entry.code),
                       .key = make_builder_key(entry.code),
                       .amount = entry.amount,
                       .extra_data = std::move(entry.extra_data)});
  }
  return instructions;
}

send_instructions_t builder_rewards::handle_send(const call_context_t& context,
                                                 const address_t& campaign,
                                                 const address_t&,
                                                 const bytes_view_t& hook_data) {
  auto found = require_manager(context, campaign);
  auto instructions = send_instructions_t{};
  auto total = amount_t{};
  for (auto& entry :
       decode_payload<std::vector<builder_payout_t>>(hook_data, "send")) {
    total += entry.amount;
    instructions.payouts.push_back(
        payout_t{.recipient = resolve(entry.code),
                 .amount = entry.amount,
                 .extra_data = std::move(entry.extra_data)});
  }
  auto fee = total * found.fee_bps / kMaxFeeBasisPoints;
  if (fee > 0) {
    instructions.fees.push_back(
        distribution_t{.recipient = found.fee_recipient,
                       .key = make_key(found.fee_recipient),
                       .amount = fee});
  }
  return instructions;
}

std::vector<distribution_t> builder_rewards::handle_distribute_fees(
    const call_context_t& context,
    const address_t& campaign,
    const address_t&,
    const bytes_view_t& hook_data) {
  auto found = lookup(campaign);
  if (context.sender != found.manager &&
      context.sender != found.fee_recipient) {
    throw hook_error{hook_error_code::unauthorized,
                     "sender is neither manager nor fee recipient"};
  }
  auto amount = decode_payload<amount_t>(hook_data, "distribute_fees");
  return {distribution_t{.recipient = found.fee_recipient,
                         .key = make_key(found.fee_recipient),
                         .amount = amount}};
}

payout_t builder_rewards::handle_withdraw_funds(const call_context_t& context,
                                                const address_t& campaign,
                                                const address_t&,
                                                const bytes_view_t& hook_data) {
  require_manager(context, campaign);
  return decode_payload<payout_t>(hook_data, "withdraw_funds");
}

}  // namespace flywheel::hooks
