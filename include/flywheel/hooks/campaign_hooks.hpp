#pragma once

#include <flywheel/hooks/ledger_view.hpp>
#include <flywheel/schema/campaign_status.hpp>
#include <flywheel/schema/hook_instructions.hpp>
#include <flywheel/schema/payout.hpp>
#include <flywheel/schema/primitives.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace flywheel::hooks {

inline constexpr auto kHooksCodespace = std::string_view{"flywheel.hooks"};

/// Codes shared by every hook; concrete hooks start their own at 100.
enum class hook_error_code : uint32_t {
  unsupported = 1,
  unauthorized = 2,
  invalid_payload = 3,
};

/// Policy rejection raised by a hook. The engine aborts the call and
/// reports codespace, code and message unchanged.
class hook_error final : public std::runtime_error {
 public:
  hook_error(std::string codespace, uint32_t code, const std::string& message);
  hook_error(hook_error_code code, const std::string& message);

  const std::string& codespace() const { return codespace_; }
  uint32_t code() const { return code_; }

 private:
  std::string codespace_;
  uint32_t code_{};
};

/// Identity of a callback invocation.
struct call_context_t final {
  /// Who invoked the hook; must be the engine the hook was bound to.
  flywheel::schema::address_t invoker{};
  /// Account that called the engine.
  flywheel::schema::address_t sender{};
  /// Call-time clock.
  flywheel::schema::timestamp_milliseconds_t block_time{};
  /// Ledger reads for the callback. Hooks must read through this rather
  /// than the engine's public accessors, which would block on the call in
  /// progress.
  const ledger_view* ledger{nullptr};
};

/// Campaign policy module.
///
/// The public `on_*` entry points check that the invoker is the bound
/// engine and dispatch to the protected `handle_*` overrides. Hooks compute
/// what should move; they never touch ledger state. Every handler defaults
/// to rejecting with `unsupported`.
class campaign_hooks {
 public:
  campaign_hooks(flywheel::schema::address_t address,
                 flywheel::schema::address_t engine);
  virtual ~campaign_hooks() = default;

  campaign_hooks(const campaign_hooks&) = delete;
  campaign_hooks& operator=(const campaign_hooks&) = delete;

  const flywheel::schema::address_t& address() const { return address_; }
  const flywheel::schema::address_t& engine() const { return engine_; }

  void on_create_campaign(const call_context_t& context,
                          const flywheel::schema::address_t& campaign,
                          const flywheel::schema::nonce_t& nonce,
                          const flywheel::schema::bytes_view_t& hook_data);

  void on_update_status(const call_context_t& context,
                        const flywheel::schema::address_t& campaign,
                        flywheel::schema::campaign_status_t old_status,
                        flywheel::schema::campaign_status_t new_status,
                        const flywheel::schema::bytes_view_t& hook_data);

  void on_update_metadata(const call_context_t& context,
                          const flywheel::schema::address_t& campaign,
                          const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::allocate_instructions_t on_allocate(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  std::vector<flywheel::schema::allocation_t> on_deallocate(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::distribute_instructions_t on_distribute(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::send_instructions_t on_send(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  std::vector<flywheel::schema::distribution_t> on_distribute_fees(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::payout_t on_withdraw_funds(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  /// Read-only; callable by anyone.
  virtual std::string campaign_uri(
      const flywheel::schema::address_t& campaign) const = 0;

 protected:
  virtual void handle_create_campaign(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::nonce_t& nonce,
      const flywheel::schema::bytes_view_t& hook_data) = 0;

  virtual void handle_update_status(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      flywheel::schema::campaign_status_t old_status,
      flywheel::schema::campaign_status_t new_status,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual void handle_update_metadata(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual flywheel::schema::allocate_instructions_t handle_allocate(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual std::vector<flywheel::schema::allocation_t> handle_deallocate(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual flywheel::schema::distribute_instructions_t handle_distribute(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual flywheel::schema::send_instructions_t handle_send(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual std::vector<flywheel::schema::distribution_t> handle_distribute_fees(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  virtual flywheel::schema::payout_t handle_withdraw_funds(
      const call_context_t& context,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

 private:
  void require_engine(const call_context_t& context) const;

  flywheel::schema::address_t address_;
  flywheel::schema::address_t engine_;
};

}  // namespace flywheel::hooks
