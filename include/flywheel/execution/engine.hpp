#pragma once

#include <flywheel/assets/asset_book.hpp>
#include <flywheel/execution/engine_options.hpp>
#include <flywheel/hooks/campaign_hooks.hpp>
#include <flywheel/schema/campaign_state.hpp>
#include <flywheel/schema/campaign_status.hpp>
#include <flywheel/schema/hook_instructions.hpp>
#include <flywheel/schema/ledger_event.hpp>
#include <flywheel/schema/operation_result.hpp>
#include <flywheel/schema/primitives.hpp>
#include <flywheel/state/overlay.hpp>
#include <flywheel/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flywheel::execution {

/// Campaign registry and ledger.
///
/// Owns campaign identity and status, every payout and fee allocation
/// counter, and the event log. Calls into each campaign's hooks for
/// authorization and amounts, moves value through the campaign vault and
/// enforces solvency:
///
///   vault balance >= total fees + total payouts (payouts excluded once
///   the campaign is FINALIZED)
///
/// Each public operation is serialized and atomic. State changes are staged
/// in an overlay and committed as one RocksDB write batch; any failure
/// discards them and is reported through the returned result.
class engine final {
 public:
  engine(flywheel::storage::rocksdb_storage_t& storage,
         engine_options_t options);

  /// Make a hooks implementation available for campaign creation. Its
  /// engine address must be this engine's.
  void register_hooks(std::shared_ptr<flywheel::hooks::campaign_hooks> hooks);

  /// Call-time clock handed to hooks and stamped on events.
  void set_block_time(flywheel::schema::timestamp_milliseconds_t block_time);
  flywheel::schema::timestamp_milliseconds_t block_time() const;

  const flywheel::schema::address_t& address() const {
    return options_.address;
  }

  /// Network-side funding and configuration. Funding commits immediately.
  void fund(const flywheel::schema::address_t& asset,
            const flywheel::schema::address_t& holder,
            const flywheel::schema::amount_t& amount);
  void set_token_behavior(const flywheel::schema::address_t& asset,
                          flywheel::assets::token_behavior_t behavior);
  void set_rejects(const flywheel::schema::address_t& asset,
                   const flywheel::schema::address_t& holder,
                   bool rejects);
  flywheel::schema::amount_t balance_of(
      const flywheel::schema::address_t& asset,
      const flywheel::schema::address_t& holder) const;

  /// Get-or-create. Repeating the same (hooks, nonce, hook_data) returns the
  /// existing campaign with no events and no hook call.
  flywheel::schema::operation_result_t create_campaign(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& hooks,
      const flywheel::schema::nonce_t& nonce,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::operation_result_t update_status(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      flywheel::schema::campaign_status_t status,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::operation_result_t update_metadata(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::bytes_view_t& hook_data);

  /// Reserve payouts (and optional fees). Bookkeeping only.
  flywheel::schema::operation_result_t allocate(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::operation_result_t deallocate(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  /// Pay out previously allocated amounts. Any failed transfer aborts.
  flywheel::schema::operation_result_t distribute(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  /// Immediate payouts. Fees that cannot (or should not) be sent now are
  /// reserved instead.
  flywheel::schema::operation_result_t send(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  /// Pay out reserved fees. A failed transfer leaves its reservation in
  /// place and emits `fee_transfer_failed` without aborting.
  flywheel::schema::operation_result_t distribute_fees(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  flywheel::schema::operation_result_t withdraw_funds(
      const flywheel::schema::address_t& sender,
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::bytes_view_t& hook_data);

  bool campaign_exists(const flywheel::schema::address_t& campaign) const;
  std::optional<flywheel::schema::campaign_status_t> campaign_status(
      const flywheel::schema::address_t& campaign) const;
  std::optional<flywheel::schema::address_t> campaign_hooks(
      const flywheel::schema::address_t& campaign) const;
  std::optional<std::string> campaign_uri(
      const flywheel::schema::address_t& campaign) const;

  flywheel::schema::amount_t total_allocated_payouts(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset) const;
  flywheel::schema::amount_t total_allocated_fees(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset) const;
  flywheel::schema::amount_t allocated_payout(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::hash32_t& key) const;
  flywheel::schema::amount_t allocated_fee(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      const flywheel::schema::hash32_t& key) const;

  /// Committed events with sequence in [from, to]. Only that range is read.
  std::vector<flywheel::schema::event_record_t> events(uint64_t from,
                                                       uint64_t to) const;
  uint64_t last_event_sequence() const;

 private:
  /// Lock-free reads for hooks; valid while `run` holds the mutex.
  class call_view final : public flywheel::hooks::ledger_view {
   public:
    explicit call_view(const engine& owner) : owner_{owner} {}

    std::optional<flywheel::schema::campaign_status_t> campaign_status(
        const flywheel::schema::address_t& campaign) const override;
    flywheel::schema::amount_t total_allocated_payouts(
        const flywheel::schema::address_t& campaign,
        const flywheel::schema::address_t& asset) const override;
    flywheel::schema::amount_t total_allocated_fees(
        const flywheel::schema::address_t& campaign,
        const flywheel::schema::address_t& asset) const override;
    flywheel::schema::amount_t allocated_payout(
        const flywheel::schema::address_t& campaign,
        const flywheel::schema::address_t& asset,
        const flywheel::schema::hash32_t& key) const override;
    flywheel::schema::amount_t allocated_fee(
        const flywheel::schema::address_t& campaign,
        const flywheel::schema::address_t& asset,
        const flywheel::schema::hash32_t& key) const override;
    flywheel::schema::amount_t balance_of(
        const flywheel::schema::address_t& asset,
        const flywheel::schema::address_t& holder) const override;

   private:
    const engine& owner_;
  };

  using operation_fn_t =
      std::function<void(flywheel::schema::operation_result_t&)>;

  flywheel::schema::operation_result_t run(std::string_view operation,
                                           const operation_fn_t& fn);
  void fail(flywheel::schema::operation_result_t& result,
            std::string_view operation,
            uint32_t code,
            std::string_view codespace,
            std::string_view log);
  uint64_t read_event_sequence() const;
  void append_events(const std::vector<flywheel::schema::ledger_event_t>& events);
  void emit(flywheel::schema::operation_result_t& result,
            flywheel::schema::ledger_event_t event);

  flywheel::hooks::call_context_t context(
      const flywheel::schema::address_t& sender) const;
  std::optional<flywheel::schema::campaign_state_t> find_campaign(
      const flywheel::schema::address_t& campaign) const;
  std::optional<flywheel::schema::campaign_status_t> status_of(
      const flywheel::schema::address_t& campaign) const;
  flywheel::schema::campaign_state_t load_campaign(
      const flywheel::schema::address_t& campaign) const;
  flywheel::hooks::campaign_hooks& hooks_for(
      const flywheel::schema::address_t& hooks) const;
  void require_accepting_payouts(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::campaign_state_t& state) const;

  flywheel::schema::amount_t read_amount(
      const flywheel::schema::bytes_t& key) const;
  void write_amount(const flywheel::schema::bytes_t& key,
                    const flywheel::schema::amount_t& amount);
  void increase(const flywheel::schema::bytes_t& key,
                const flywheel::schema::amount_t& amount);
  void decrease(const flywheel::schema::bytes_t& key,
                const flywheel::schema::amount_t& amount);

  void add_payout_allocation(const flywheel::schema::address_t& campaign,
                             const flywheel::schema::address_t& asset,
                             const flywheel::schema::hash32_t& key,
                             const flywheel::schema::amount_t& amount);
  void remove_payout_allocation(const flywheel::schema::address_t& campaign,
                                const flywheel::schema::address_t& asset,
                                const flywheel::schema::hash32_t& key,
                                const flywheel::schema::amount_t& amount);
  void add_fee_allocation(const flywheel::schema::address_t& campaign,
                          const flywheel::schema::address_t& asset,
                          const flywheel::schema::hash32_t& key,
                          const flywheel::schema::amount_t& amount);
  void remove_fee_allocation(const flywheel::schema::address_t& campaign,
                             const flywheel::schema::address_t& asset,
                             const flywheel::schema::hash32_t& key,
                             const flywheel::schema::amount_t& amount);

  /// Balance the vault must keep for (campaign, asset) in `status`.
  flywheel::schema::amount_t required_reserve(
      const flywheel::schema::address_t& campaign,
      const flywheel::schema::address_t& asset,
      flywheel::schema::campaign_status_t status) const;
  void require_solvent(const flywheel::schema::address_t& campaign,
                       const flywheel::schema::address_t& asset,
                       flywheel::schema::campaign_status_t status) const;

  bool transfer_from_vault(const flywheel::schema::address_t& campaign,
                           const flywheel::schema::address_t& asset,
                           const flywheel::schema::address_t& recipient,
                           const flywheel::schema::amount_t& amount);
  void process_fees(flywheel::schema::operation_result_t& result,
                    const flywheel::schema::address_t& campaign,
                    const flywheel::schema::address_t& asset,
                    const std::vector<flywheel::schema::distribution_t>& fees,
                    bool send_fees_now);

  mutable std::mutex mutex_;
  engine_options_t options_;
  flywheel::state::overlay state_;
  flywheel::assets::asset_book assets_;
  std::map<flywheel::schema::address_t,
           std::shared_ptr<flywheel::hooks::campaign_hooks>>
      hooks_;
  flywheel::schema::timestamp_milliseconds_t block_time_{};
  call_view view_{*this};
};

}  // namespace flywheel::execution
