#include <flywheel/common/ledger_error.hpp>
#include <flywheel/vault/vault.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace flywheel::schema;

namespace flywheel::vault {

vault::vault(address_t address,
             address_t controller,
             flywheel::assets::asset_book& assets)
    : address_{std::move(address)},
      controller_{std::move(controller)},
      assets_{assets} {}

bool vault::send_tokens(const address_t& caller,
                        const address_t& asset,
                        const address_t& recipient,
                        const amount_t& amount) {
  if (caller != controller_) {
    throw flywheel::common::ledger_error{error_code::unauthorized,
                                         "vault caller is not its controller"};
  }
  try {
    return assets_.transfer(asset, address_, recipient, amount);
  } catch (const flywheel::assets::transfer_reverted& ex) {
    spdlog::debug("Vault {} transfer of {} {} to {} reverted: {}",
                  to_hex(address_), amount.str(), to_hex(asset),
                  to_hex(recipient), ex.what());
    return false;
  }
}

amount_t vault::balance(const address_t& asset) const {
  return assets_.balance_of(asset, address_);
}

}  // namespace flywheel::vault
