#include <flywheel/assets/asset_book.hpp>
#include <flywheel/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <string>

using namespace flywheel::schema;

namespace flywheel::assets {

asset_book::asset_book(flywheel::state::overlay& state) : state_{state} {}

amount_t asset_book::balance_of(const address_t& asset,
                                const address_t& holder) const {
  auto key = key::make_balance_key(asset, holder);
  return state_.get_value<amount_t>(make_bytes_view(key)).value_or(amount_t{});
}

void asset_book::mint(const address_t& asset,
                      const address_t& holder,
                      const amount_t& amount) {
  auto balance = balance_of(asset, holder);
  if (balance + amount < balance) {
    throw transfer_reverted{"balance overflow"};
  }
  write_balance(asset, holder, balance + amount);
}

bool asset_book::transfer(const address_t& asset,
                          const address_t& from,
                          const address_t& to,
                          const amount_t& amount) {
  if (rejects(asset, to)) {
    return fail(asset, is_native(asset) ? "receiver rejected native value"
                                        : "recipient blocked by token");
  }
  auto from_balance = balance_of(asset, from);
  if (from_balance < amount) {
    return fail(asset, "insufficient balance");
  }
  if (from == to || amount == 0) {
    return true;
  }
  write_balance(asset, from, from_balance - amount);
  write_balance(asset, to, balance_of(asset, to) + amount);
  return true;
}

void asset_book::set_token_behavior(const address_t& asset,
                                    const token_behavior_t behavior) {
  behaviors_[asset] = behavior;
}

token_behavior_t asset_book::token_behavior(const address_t& asset) const {
  auto it = behaviors_.find(asset);
  return it == std::end(behaviors_) ? token_behavior_t::reverting : it->second;
}

void asset_book::set_rejects(const address_t& asset,
                             const address_t& holder,
                             const bool rejects) {
  if (rejects) {
    rejecting_.emplace(asset, holder);
  } else {
    rejecting_.erase(std::pair{asset, holder});
  }
}

bool asset_book::rejects(const address_t& asset,
                         const address_t& holder) const {
  return rejecting_.contains(std::pair{asset, holder});
}

bool asset_book::fail(const address_t& asset, std::string_view reason) const {
  if (!is_native(asset) &&
      token_behavior(asset) == token_behavior_t::returning_false) {
    spdlog::debug("Token {} transfer returned false: {}", to_hex(asset),
                  reason);
    return false;
  }
  throw transfer_reverted{std::string{reason}};
}

void asset_book::write_balance(const address_t& asset,
                               const address_t& holder,
                               const amount_t& amount) {
  auto key = key::make_balance_key(asset, holder);
  state_.put_value(make_bytes_view(key), amount);
}

}  // namespace flywheel::assets
