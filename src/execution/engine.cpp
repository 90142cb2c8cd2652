#include <flywheel/common/critical.hpp>
#include <flywheel/common/ledger_error.hpp>
#include <flywheel/execution/campaign_address.hpp>
#include <flywheel/execution/engine.hpp>
#include <flywheel/schema/key/engine_keys.hpp>
#include <flywheel/vault/vault.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

using namespace flywheel::schema;
using flywheel::common::ledger_error;

namespace flywheel::execution {

engine::engine(flywheel::storage::rocksdb_storage_t& storage,
               engine_options_t options)
    : options_{std::move(options)}, state_{storage}, assets_{state_} {
  spdlog::info("Ledger engine {} ready with {} recorded event(s)",
               to_hex(options_.address), read_event_sequence());
}

void engine::register_hooks(
    std::shared_ptr<flywheel::hooks::campaign_hooks> hooks) {
  if (!hooks) {
    throw std::invalid_argument{"hooks must not be null"};
  }
  if (hooks->engine() != options_.address) {
    throw std::invalid_argument{"hooks " + to_hex(hooks->address()) +
                                " are bound to another engine"};
  }
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Registered hooks {}", to_hex(hooks->address()));
  hooks_.insert_or_assign(hooks->address(), std::move(hooks));
}

void engine::set_block_time(const timestamp_milliseconds_t block_time) {
  auto lock = std::scoped_lock{mutex_};
  block_time_ = block_time;
}

timestamp_milliseconds_t engine::block_time() const {
  auto lock = std::scoped_lock{mutex_};
  return block_time_;
}

void engine::fund(const address_t& asset,
                  const address_t& holder,
                  const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  try {
    assets_.mint(asset, holder, amount);
  } catch (const flywheel::assets::transfer_reverted&) {
    state_.discard();
    throw;
  }
  state_.commit();
  spdlog::debug("Funded {} with {} of {}", to_hex(holder), amount.str(),
                to_hex(asset));
}

void engine::set_token_behavior(
    const address_t& asset,
    const flywheel::assets::token_behavior_t behavior) {
  auto lock = std::scoped_lock{mutex_};
  assets_.set_token_behavior(asset, behavior);
}

void engine::set_rejects(const address_t& asset,
                         const address_t& holder,
                         const bool rejects) {
  auto lock = std::scoped_lock{mutex_};
  assets_.set_rejects(asset, holder, rejects);
}

amount_t engine::balance_of(const address_t& asset,
                            const address_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  return assets_.balance_of(asset, holder);
}

operation_result_t engine::create_campaign(const address_t& sender,
                                           const address_t& hooks,
                                           const nonce_t& nonce,
                                           const bytes_view_t& hook_data) {
  return run("create_campaign", [&](operation_result_t& result) {
    auto campaign = predict_campaign_address(hooks, nonce, hook_data);
    result.campaign = campaign;
    if (find_campaign(campaign)) {
      spdlog::debug("Campaign {} already exists", to_hex(campaign));
      return;
    }
    auto& policy = hooks_for(hooks);

    auto campaign_key = key::make_campaign_key(campaign);
    state_.put_value(make_bytes_view(campaign_key), campaign_state_t{.hooks = hooks});
    emit(result, campaign_created_t{.campaign = campaign, .hooks = hooks});

    // Hook state is not part of the overlay, so creation runs last.
    policy.on_create_campaign(context(sender), campaign, nonce, hook_data);
    spdlog::info("Created campaign {} with hooks {}", to_hex(campaign),
                 to_hex(hooks));
  });
}

operation_result_t engine::update_status(const address_t& sender,
                                         const address_t& campaign,
                                         const campaign_status_t status,
                                         const bytes_view_t& hook_data) {
  return run("update_status", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    if (!is_valid_transition(state.status, status)) {
      throw ledger_error{error_code::invalid_campaign_status,
                         "cannot move campaign from " +
                             std::string{to_string(state.status)} + " to " +
                             std::string{to_string(status)}};
    }
    hooks_for(state.hooks).on_update_status(context(sender), campaign,
                                            state.status, status, hook_data);

    emit(result, campaign_status_updated_t{.campaign = campaign,
                                           .sender = sender,
                                           .old_status = state.status,
                                           .new_status = status});
    spdlog::info("Campaign {} status {} -> {}", to_hex(campaign),
                 to_string(state.status), to_string(status));
    state.status = status;
    auto campaign_key = key::make_campaign_key(campaign);
    state_.put_value(make_bytes_view(campaign_key), state);
  });
}

operation_result_t engine::update_metadata(const address_t& sender,
                                           const address_t& campaign,
                                           const bytes_view_t& hook_data) {
  return run("update_metadata", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    if (state.status == campaign_status_t::finalized) {
      throw ledger_error{error_code::invalid_campaign_status,
                         "finalized campaigns cannot change metadata"};
    }
    auto& policy = hooks_for(state.hooks);
    policy.on_update_metadata(context(sender), campaign, hook_data);
    emit(result, campaign_metadata_updated_t{
                     .campaign = campaign, .uri = policy.campaign_uri(campaign)});
    emit(result, contract_uri_updated_t{.campaign = campaign});
  });
}

operation_result_t engine::allocate(const address_t& sender,
                                    const address_t& campaign,
                                    const address_t& asset,
                                    const bytes_view_t& hook_data) {
  return run("allocate", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    require_accepting_payouts(campaign, state);
    auto instructions = hooks_for(state.hooks).on_allocate(
        context(sender), campaign, asset, hook_data);

    for (const auto& allocation : instructions.allocations) {
      if (allocation.amount == 0) {
        continue;
      }
      add_payout_allocation(campaign, asset, allocation.key, allocation.amount);
      emit(result, payout_allocated_t{.campaign = campaign,
                                      .asset = asset,
                                      .key = allocation.key,
                                      .amount = allocation.amount,
                                      .extra_data = allocation.extra_data});
    }
    for (const auto& fee : instructions.fees) {
      if (fee.amount == 0) {
        continue;
      }
      add_fee_allocation(campaign, asset, fee.key, fee.amount);
      emit(result, fee_allocated_t{.campaign = campaign,
                                   .asset = asset,
                                   .key = fee.key,
                                   .amount = fee.amount,
                                   .extra_data = fee.extra_data});
    }
    require_solvent(campaign, asset, state.status);
  });
}

operation_result_t engine::deallocate(const address_t& sender,
                                      const address_t& campaign,
                                      const address_t& asset,
                                      const bytes_view_t& hook_data) {
  return run("deallocate", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    require_accepting_payouts(campaign, state);
    auto allocations = hooks_for(state.hooks).on_deallocate(
        context(sender), campaign, asset, hook_data);

    for (const auto& allocation : allocations) {
      if (allocation.amount == 0) {
        continue;
      }
      remove_payout_allocation(campaign, asset, allocation.key,
                               allocation.amount);
      emit(result, payouts_deallocated_t{.campaign = campaign,
                                         .asset = asset,
                                         .key = allocation.key,
                                         .amount = allocation.amount,
                                         .extra_data = allocation.extra_data});
    }
  });
}

operation_result_t engine::distribute(const address_t& sender,
                                      const address_t& campaign,
                                      const address_t& asset,
                                      const bytes_view_t& hook_data) {
  return run("distribute", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    require_accepting_payouts(campaign, state);
    auto instructions = hooks_for(state.hooks).on_distribute(
        context(sender), campaign, asset, hook_data);

    for (const auto& distribution : instructions.distributions) {
      if (distribution.amount == 0) {
        continue;
      }
      remove_payout_allocation(campaign, asset, distribution.key,
                               distribution.amount);
      if (!transfer_from_vault(campaign, asset, distribution.recipient,
                               distribution.amount)) {
        throw ledger_error{error_code::send_failed,
                           "distribution to " + to_hex(distribution.recipient) +
                               " failed"};
      }
      emit(result, payouts_distributed_t{.campaign = campaign,
                                         .asset = asset,
                                         .key = distribution.key,
                                         .recipient = distribution.recipient,
                                         .amount = distribution.amount,
                                         .extra_data = distribution.extra_data});
    }
    process_fees(result, campaign, asset, instructions.fees,
                 instructions.send_fees_now);
    require_solvent(campaign, asset, state.status);
  });
}

operation_result_t engine::send(const address_t& sender,
                                const address_t& campaign,
                                const address_t& asset,
                                const bytes_view_t& hook_data) {
  return run("send", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    require_accepting_payouts(campaign, state);
    require_solvent(campaign, asset, state.status);
    auto instructions = hooks_for(state.hooks).on_send(context(sender),
                                                       campaign, asset,
                                                       hook_data);

    for (const auto& payout : instructions.payouts) {
      if (payout.amount == 0) {
        continue;
      }
      if (!transfer_from_vault(campaign, asset, payout.recipient,
                               payout.amount)) {
        throw ledger_error{error_code::send_failed,
                           "payout to " + to_hex(payout.recipient) + " failed"};
      }
      emit(result, payout_sent_t{.campaign = campaign,
                                 .asset = asset,
                                 .recipient = payout.recipient,
                                 .amount = payout.amount,
                                 .extra_data = payout.extra_data});
    }
    process_fees(result, campaign, asset, instructions.fees,
                 instructions.send_fees_now);
    require_solvent(campaign, asset, state.status);
  });
}

operation_result_t engine::distribute_fees(const address_t& sender,
                                           const address_t& campaign,
                                           const address_t& asset,
                                           const bytes_view_t& hook_data) {
  return run("distribute_fees", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    auto distributions = hooks_for(state.hooks).on_distribute_fees(
        context(sender), campaign, asset, hook_data);

    for (const auto& fee : distributions) {
      if (fee.amount == 0) {
        continue;
      }
      remove_fee_allocation(campaign, asset, fee.key, fee.amount);
      if (transfer_from_vault(campaign, asset, fee.recipient, fee.amount)) {
        emit(result, fees_distributed_t{.campaign = campaign,
                                        .asset = asset,
                                        .key = fee.key,
                                        .recipient = fee.recipient,
                                        .amount = fee.amount,
                                        .extra_data = fee.extra_data});
        continue;
      }
      spdlog::warn("Fee transfer of {} to {} failed; reservation kept",
                   fee.amount.str(), to_hex(fee.recipient));
      add_fee_allocation(campaign, asset, fee.key, fee.amount);
      emit(result, fee_transfer_failed_t{.campaign = campaign,
                                         .asset = asset,
                                         .key = fee.key,
                                         .recipient = fee.recipient,
                                         .amount = fee.amount,
                                         .extra_data = fee.extra_data});
    }
    require_solvent(campaign, asset, state.status);
  });
}

operation_result_t engine::withdraw_funds(const address_t& sender,
                                          const address_t& campaign,
                                          const address_t& asset,
                                          const bytes_view_t& hook_data) {
  return run("withdraw_funds", [&](operation_result_t& result) {
    auto state = load_campaign(campaign);
    auto payout = hooks_for(state.hooks).on_withdraw_funds(
        context(sender), campaign, asset, hook_data);
    if (payout.amount == 0) {
      throw ledger_error{error_code::zero_amount, "withdrawal of zero"};
    }

    auto balance = assets_.balance_of(asset, campaign);
    auto required = required_reserve(campaign, asset, state.status);
    if (balance < payout.amount || balance - payout.amount < required) {
      throw ledger_error{error_code::insufficient_campaign_funds,
                         "withdrawal of " + payout.amount.str() +
                             " exceeds free balance"};
    }
    if (!transfer_from_vault(campaign, asset, payout.recipient,
                             payout.amount)) {
      throw ledger_error{error_code::send_failed,
                         "withdrawal to " + to_hex(payout.recipient) +
                             " failed"};
    }
    require_solvent(campaign, asset, state.status);
    emit(result, funds_withdrawn_t{.campaign = campaign,
                                   .asset = asset,
                                   .recipient = payout.recipient,
                                   .amount = payout.amount,
                                   .extra_data = payout.extra_data});
    spdlog::info("Withdrew {} of {} from campaign {}", payout.amount.str(),
                 to_hex(asset), to_hex(campaign));
  });
}

bool engine::campaign_exists(const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  return find_campaign(campaign).has_value();
}

std::optional<campaign_status_t> engine::campaign_status(
    const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  return status_of(campaign);
}

std::optional<address_t> engine::campaign_hooks(
    const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = find_campaign(campaign);
  if (!state) {
    return std::nullopt;
  }
  return state->hooks;
}

std::optional<std::string> engine::campaign_uri(
    const address_t& campaign) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = find_campaign(campaign);
  if (!state) {
    return std::nullopt;
  }
  auto it = hooks_.find(state->hooks);
  if (it == std::end(hooks_)) {
    return std::nullopt;
  }
  return it->second->campaign_uri(campaign);
}

amount_t engine::total_allocated_payouts(const address_t& campaign,
                                         const address_t& asset) const {
  auto lock = std::scoped_lock{mutex_};
  return read_amount(key::make_total_payouts_key(campaign, asset));
}

amount_t engine::total_allocated_fees(const address_t& campaign,
                                      const address_t& asset) const {
  auto lock = std::scoped_lock{mutex_};
  return read_amount(key::make_total_fees_key(campaign, asset));
}

amount_t engine::allocated_payout(const address_t& campaign,
                                  const address_t& asset,
                                  const hash32_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  return read_amount(key::make_payout_allocation_key(campaign, asset, key));
}

amount_t engine::allocated_fee(const address_t& campaign,
                               const address_t& asset,
                               const hash32_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  return read_amount(key::make_fee_allocation_key(campaign, asset, key));
}

std::vector<event_record_t> engine::events(const uint64_t from,
                                           const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<event_record_t>{};
  auto last = std::min(to, read_event_sequence());
  for (auto sequence = std::max<uint64_t>(from, 1); sequence <= last;
       ++sequence) {
    auto event_key = key::make_event_key(sequence);
    auto record = state_.get_value<event_record_t>(make_bytes_view(event_key));
    if (!record) {
      flywheel::common::critical("event log has a gap");
    }
    records.push_back(std::move(*record));
  }
  return records;
}

uint64_t engine::last_event_sequence() const {
  auto lock = std::scoped_lock{mutex_};
  return read_event_sequence();
}

uint64_t engine::read_event_sequence() const {
  auto sequence_key = make_bytes(key::kEventSequenceKey);
  return state_.get_value<uint64_t>(make_bytes_view(sequence_key)).value_or(0);
}

operation_result_t engine::run(const std::string_view operation,
                               const operation_fn_t& fn) {
  auto lock = std::scoped_lock{mutex_};
  auto result = operation_result_t{};
  try {
    fn(result);
    append_events(result.events);
    state_.commit();
    spdlog::debug("{} committed with {} event(s)", operation,
                  result.events.size());
  } catch (const ledger_error& ex) {
    fail(result, operation, static_cast<uint32_t>(ex.code()), kEngineCodespace,
         ex.what());
  } catch (const flywheel::hooks::hook_error& ex) {
    fail(result, operation, ex.code(), ex.codespace(), ex.what());
  } catch (const std::exception& ex) {
    fail(result, operation, static_cast<uint32_t>(error_code::hook_failure),
         kEngineCodespace, ex.what());
  } catch (...) {
    fail(result, operation, static_cast<uint32_t>(error_code::hook_failure),
         kEngineCodespace, "hooks raised a non-standard exception");
  }
  return result;
}

void engine::fail(operation_result_t& result,
                  const std::string_view operation,
                  const uint32_t code,
                  const std::string_view codespace,
                  const std::string_view log) {
  state_.discard();
  result.code = code;
  result.codespace = std::string{codespace};
  result.log = std::string{log};
  result.events.clear();
  result.campaign.reset();
  spdlog::warn("{} rejected ({}:{}): {}", operation, codespace, code, log);
}

void engine::append_events(const std::vector<ledger_event_t>& events) {
  if (events.empty()) {
    return;
  }
  auto sequence = read_event_sequence();
  for (const auto& event : events) {
    ++sequence;
    auto event_key = key::make_event_key(sequence);
    state_.put_value(make_bytes_view(event_key),
                     event_record_t{.sequence = sequence,
                                    .recorded_at = block_time_,
                                    .event = event});
  }
  auto sequence_key = make_bytes(key::kEventSequenceKey);
  state_.put_value(make_bytes_view(sequence_key), sequence);
}

void engine::emit(operation_result_t& result, ledger_event_t event) {
  spdlog::debug("Event {}", event_name(event));
  result.events.push_back(std::move(event));
}

flywheel::hooks::call_context_t engine::context(const address_t& sender) const {
  return flywheel::hooks::call_context_t{.invoker = options_.address,
                                         .sender = sender,
                                         .block_time = block_time_,
                                         .ledger = &view_};
}

std::optional<campaign_state_t> engine::find_campaign(
    const address_t& campaign) const {
  auto campaign_key = key::make_campaign_key(campaign);
  return state_.get_value<campaign_state_t>(make_bytes_view(campaign_key));
}

std::optional<campaign_status_t> engine::status_of(
    const address_t& campaign) const {
  auto state = find_campaign(campaign);
  if (!state) {
    return std::nullopt;
  }
  return state->status;
}

campaign_state_t engine::load_campaign(const address_t& campaign) const {
  auto state = find_campaign(campaign);
  if (!state) {
    throw ledger_error{error_code::campaign_does_not_exist,
                       "campaign " + to_hex(campaign) + " does not exist"};
  }
  return *state;
}

flywheel::hooks::campaign_hooks& engine::hooks_for(
    const address_t& hooks) const {
  auto it = hooks_.find(hooks);
  if (it == std::end(hooks_)) {
    throw ledger_error{error_code::hooks_not_registered,
                       "hooks " + to_hex(hooks) + " are not registered"};
  }
  return *it->second;
}

void engine::require_accepting_payouts(const address_t& campaign,
                                       const campaign_state_t& state) const {
  if (!is_accepting_payouts(state.status)) {
    throw ledger_error{error_code::invalid_campaign_status,
                       "campaign " + to_hex(campaign) + " is " +
                           std::string{to_string(state.status)}};
  }
}

amount_t engine::read_amount(const bytes_t& key) const {
  return state_.get_value<amount_t>(make_bytes_view(key)).value_or(amount_t{});
}

void engine::write_amount(const bytes_t& key, const amount_t& amount) {
  if (amount == 0) {
    state_.erase(make_bytes_view(key));
    return;
  }
  state_.put_value(make_bytes_view(key), amount);
}

void engine::increase(const bytes_t& key, const amount_t& amount) {
  auto current = read_amount(key);
  auto updated = current + amount;
  if (updated < current) {
    throw ledger_error{error_code::amount_overflow,
                       "allocation counter overflow"};
  }
  write_amount(key, updated);
}

void engine::decrease(const bytes_t& key, const amount_t& amount) {
  auto current = read_amount(key);
  if (current < amount) {
    throw ledger_error{error_code::insufficient_allocation,
                       "cannot release " + amount.str() + " of " +
                           current.str() + " allocated"};
  }
  write_amount(key, current - amount);
}

void engine::add_payout_allocation(const address_t& campaign,
                                   const address_t& asset,
                                   const hash32_t& key,
                                   const amount_t& amount) {
  increase(key::make_payout_allocation_key(campaign, asset, key), amount);
  increase(key::make_total_payouts_key(campaign, asset), amount);
  spdlog::debug("Allocated {} to {} in campaign {}", amount.str(), to_hex(key),
                to_hex(campaign));
}

void engine::remove_payout_allocation(const address_t& campaign,
                                      const address_t& asset,
                                      const hash32_t& key,
                                      const amount_t& amount) {
  decrease(key::make_payout_allocation_key(campaign, asset, key), amount);
  decrease(key::make_total_payouts_key(campaign, asset), amount);
}

void engine::add_fee_allocation(const address_t& campaign,
                                const address_t& asset,
                                const hash32_t& key,
                                const amount_t& amount) {
  increase(key::make_fee_allocation_key(campaign, asset, key), amount);
  increase(key::make_total_fees_key(campaign, asset), amount);
}

void engine::remove_fee_allocation(const address_t& campaign,
                                   const address_t& asset,
                                   const hash32_t& key,
                                   const amount_t& amount) {
  decrease(key::make_fee_allocation_key(campaign, asset, key), amount);
  decrease(key::make_total_fees_key(campaign, asset), amount);
}

amount_t engine::required_reserve(const address_t& campaign,
                                  const address_t& asset,
                                  const campaign_status_t status) const {
  auto required = read_amount(key::make_total_fees_key(campaign, asset));
  if (status != campaign_status_t::finalized) {
    required += read_amount(key::make_total_payouts_key(campaign, asset));
  }
  return required;
}

void engine::require_solvent(const address_t& campaign,
                             const address_t& asset,
                             const campaign_status_t status) const {
  auto balance = assets_.balance_of(asset, campaign);
  auto required = required_reserve(campaign, asset, status);
  if (balance < required) {
    throw ledger_error{error_code::insufficient_campaign_funds,
                       "vault holds " + balance.str() + " but owes " +
                           required.str()};
  }
}

bool engine::transfer_from_vault(const address_t& campaign,
                                 const address_t& asset,
                                 const address_t& recipient,
                                 const amount_t& amount) {
  auto campaign_vault =
      flywheel::vault::vault{campaign, options_.address, assets_};
  return campaign_vault.send_tokens(options_.address, asset, recipient, amount);
}

void engine::process_fees(operation_result_t& result,
                          const address_t& campaign,
                          const address_t& asset,
                          const std::vector<distribution_t>& fees,
                          const bool send_fees_now) {
  for (const auto& fee : fees) {
    if (fee.amount == 0) {
      continue;
    }
    if (send_fees_now &&
        transfer_from_vault(campaign, asset, fee.recipient, fee.amount)) {
      emit(result, fee_sent_t{.campaign = campaign,
                              .asset = asset,
                              .recipient = fee.recipient,
                              .amount = fee.amount,
                              .extra_data = fee.extra_data});
      continue;
    }
    add_fee_allocation(campaign, asset, fee.key, fee.amount);
    if (send_fees_now) {
      spdlog::warn("Fee transfer of {} to {} failed; reserved instead",
                   fee.amount.str(), to_hex(fee.recipient));
      emit(result, fee_transfer_failed_t{.campaign = campaign,
                                         .asset = asset,
                                         .key = fee.key,
                                         .recipient = fee.recipient,
                                         .amount = fee.amount,
                                         .extra_data = fee.extra_data});
      continue;
    }
    emit(result, fee_allocated_t{.campaign = campaign,
                                 .asset = asset,
                                 .key = fee.key,
                                 .amount = fee.amount,
                                 .extra_data = fee.extra_data});
  }
}

std::optional<campaign_status_t> engine::call_view::campaign_status(
    const address_t& campaign) const {
  return owner_.status_of(campaign);
}

amount_t engine::call_view::total_allocated_payouts(
    const address_t& campaign,
    const address_t& asset) const {
  return owner_.read_amount(key::make_total_payouts_key(campaign, asset));
}

amount_t engine::call_view::total_allocated_fees(const address_t& campaign,
                                                 const address_t& asset) const {
  return owner_.read_amount(key::make_total_fees_key(campaign, asset));
}

amount_t engine::call_view::allocated_payout(const address_t& campaign,
                                             const address_t& asset,
                                             const hash32_t& key) const {
  return owner_.read_amount(
      key::make_payout_allocation_key(campaign, asset, key));
}

amount_t engine::call_view::allocated_fee(const address_t& campaign,
                                          const address_t& asset,
                                          const hash32_t& key) const {
  return owner_.read_amount(key::make_fee_allocation_key(campaign, asset, key));
}

amount_t engine::call_view::balance_of(const address_t& asset,
                                       const address_t& holder) const {
  return owner_.assets_.balance_of(asset, holder);
}

}  // namespace flywheel::execution
