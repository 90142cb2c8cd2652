#include <flywheel/common/ledger_error.hpp>
#include <flywheel/hooks/campaign_hooks.hpp>

#include <utility>

using namespace flywheel::schema;

namespace flywheel::hooks {

namespace {

[[noreturn]] void unsupported(const std::string_view callback) {
  throw hook_error{hook_error_code::unsupported,
                   std::string{callback} + " is not supported by these hooks"};
}

}  // namespace

hook_error::hook_error(std::string codespace,
                       const uint32_t code,
                       const std::string& message)
    : std::runtime_error{message},
      codespace_{std::move(codespace)},
      code_{code} {}

hook_error::hook_error(const hook_error_code code, const std::string& message)
    : hook_error{std::string{kHooksCodespace}, static_cast<uint32_t>(code),
                 message} {}

campaign_hooks::campaign_hooks(address_t address, address_t engine)
    : address_{std::move(address)}, engine_{std::move(engine)} {}

void campaign_hooks::require_engine(const call_context_t& context) const {
  if (context.invoker != engine_) {
    throw flywheel::common::ledger_error{
        error_code::unauthorized, "hooks may only be invoked by their engine"};
  }
}

void campaign_hooks::on_create_campaign(const call_context_t& context,
                                        const address_t& campaign,
                                        const nonce_t& nonce,
                                        const bytes_view_t& hook_data) {
  require_engine(context);
  handle_create_campaign(context, campaign, nonce, hook_data);
}

void campaign_hooks::on_update_status(const call_context_t& context,
                                      const address_t& campaign,
                                      const campaign_status_t old_status,
                                      const campaign_status_t new_status,
                                      const bytes_view_t& hook_data) {
  require_engine(context);
  handle_update_status(context, campaign, old_status, new_status, hook_data);
}

void campaign_hooks::on_update_metadata(const call_context_t& context,
                                        const address_t& campaign,
                                        const bytes_view_t& hook_data) {
  require_engine(context);
  handle_update_metadata(context, campaign, hook_data);
}

allocate_instructions_t campaign_hooks::on_allocate(
    const call_context_t& context,
    const address_t& campaign,
    const address_t& asset,
    const bytes_view_t& hook_data) {
  require_engine(context);
  return handle_allocate(context, campaign, asset, hook_data);
}

std::vector<allocation_t> campaign_hooks::on_deallocate(
    const call_context_t& context,
    const address_t& campaign,
    const address_t& asset,
    const bytes_view_t& hook_data) {
  require_engine(context);
  return handle_deallocate(context, campaign, asset, hook_data);
}

distribute_instructions_t campaign_hooks::on_distribute(
    const call_context_t& context,
    const address_t& campaign,
    const address_t& asset,
    const bytes_view_t& hook_data) {
  require_engine(context);
  return handle_distribute(context, campaign, asset, hook_data);
}

send_instructions_t campaign_hooks::on_send(const call_context_t& context,
                                            const address_t& campaign,
                                            const address_t& asset,
                                            const bytes_view_t& hook_data) {
  require_engine(context);
  return handle_send(context, campaign, asset, hook_data);
}

std::vector<distribution_t> campaign_hooks::on_distribute_fees(
    const call_context_t& context,
    const address_t& campaign,
    const address_t& asset,
    const bytes_view_t& hook_data) {
  require_engine(context);
  return handle_distribute_fees(context, campaign, asset, hook_data);
}

payout_t campaign_hooks::on_withdraw_funds(const call_context_t& context,
                                           const address_t& campaign,
                                           const address_t& asset,
                                           const bytes_view_t& hook_data) {
  require_engine(context);
  return handle_withdraw_funds(context, campaign, asset, hook_data);
}

void campaign_hooks::handle_update_status(const call_context_t&,
                                          const address_t&,
                                          campaign_status_t,
                                          campaign_status_t,
                                          const bytes_view_t&) {
  unsupported("update_status");
}

void campaign_hooks::handle_update_metadata(const call_context_t&,
                                            const address_t&,
                                            const bytes_view_t&) {
  unsupported("update_metadata");
}

allocate_instructions_t campaign_hooks::handle_allocate(const call_context_t&,
                                                        const address_t&,
                                                        const address_t&,
                                                        const bytes_view_t&) {
  unsupported("allocate");
}

std::vector<allocation_t> campaign_hooks::handle_deallocate(
    const call_context_t&,
    const address_t&,
    const address_t&,
    const bytes_view_t&) {
  unsupported("deallocate");
}

distribute_instructions_t campaign_hooks::handle_distribute(
    const call_context_t&,
    const address_t&,
    const address_t&,
    const bytes_view_t&) {
  unsupported("distribute");
}

send_instructions_t campaign_hooks::handle_send(const call_context_t&,
                                                const address_t&,
                                                const address_t&,
                                                const bytes_view_t&) {
  unsupported("send");
}

std::vector<distribution_t> campaign_hooks::handle_distribute_fees(
    const call_context_t&,
    const address_t&,
    const address_t&,
    const bytes_view_t&) {
  unsupported("distribute_fees");
}

payout_t campaign_hooks::handle_withdraw_funds(const call_context_t&,
                                               const address_t&,
                                               const address_t&,
                                               const bytes_view_t&) {
  unsupported("withdraw_funds");
}

}  // namespace flywheel::hooks
