#pragma once

#include <flywheel/schema/enum_string.hpp>
#include <flywheel/schema/primitives.hpp>
#include <flywheel/state/overlay.hpp>

#include <array>
#include <map>
#include <set>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace flywheel::assets {

/// How a fungible token reports a failed transfer.
enum class token_behavior_t : uint8_t {
  /// Failed transfers revert (throw `transfer_reverted`).
  reverting = 0,
  /// Failed transfers return false and leave balances untouched.
  returning_false = 1
};

inline constexpr auto kTokenBehaviorMappings =
    flywheel::schema::enum_mappings_t<token_behavior_t, 2>{
        std::pair<std::string_view, token_behavior_t>{
            "reverting", token_behavior_t::reverting},
        std::pair<std::string_view, token_behavior_t>{
            "returning_false", token_behavior_t::returning_false}};

inline constexpr std::string_view to_string(const token_behavior_t value) {
  return flywheel::schema::to_string(value, kTokenBehaviorMappings)
      .value_or("unknown");
}

/// A transfer reverted: insufficient balance on a reverting token, a blocked
/// token recipient, or a native-currency receiver that refuses value.
class transfer_reverted final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Network-side balance book for the native currency and every token.
///
/// Balances live in the engine's state overlay, so they commit or roll back
/// together with the ledger counters. Token behaviors and rejecting receivers
/// are network configuration and are kept in memory.
class asset_book final {
 public:
  explicit asset_book(flywheel::state::overlay& state);

  flywheel::schema::amount_t balance_of(
      const flywheel::schema::address_t& asset,
      const flywheel::schema::address_t& holder) const;

  /// Credit new units to holder (funding from outside the ledger).
  void mint(const flywheel::schema::address_t& asset,
            const flywheel::schema::address_t& holder,
            const flywheel::schema::amount_t& amount);

  /// Move units between holders.
  ///
  /// Returns false only for `returning_false` tokens; every other failure
  /// throws `transfer_reverted`.
  bool transfer(const flywheel::schema::address_t& asset,
                const flywheel::schema::address_t& from,
                const flywheel::schema::address_t& to,
                const flywheel::schema::amount_t& amount);

  void set_token_behavior(const flywheel::schema::address_t& asset,
                          token_behavior_t behavior);
  token_behavior_t token_behavior(
      const flywheel::schema::address_t& asset) const;

  /// Make every transfer of `asset` to `holder` fail. For the native asset
  /// this models a receiver whose code reverts on incoming value.
  void set_rejects(const flywheel::schema::address_t& asset,
                   const flywheel::schema::address_t& holder,
                   bool rejects);
  bool rejects(const flywheel::schema::address_t& asset,
               const flywheel::schema::address_t& holder) const;

 private:
  bool fail(const flywheel::schema::address_t& asset,
            std::string_view reason) const;
  void write_balance(const flywheel::schema::address_t& asset,
                     const flywheel::schema::address_t& holder,
                     const flywheel::schema::amount_t& amount);

  flywheel::state::overlay& state_;
  std::map<flywheel::schema::address_t, token_behavior_t> behaviors_;
  std::set<std::pair<flywheel::schema::address_t, flywheel::schema::address_t>>
      rejecting_;
};

}  // namespace flywheel::assets
