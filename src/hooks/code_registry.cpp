#include <flywheel/hooks/code_registry.hpp>
#include <spdlog/spdlog.h>

using namespace flywheel::schema;

namespace flywheel::hooks {

bool code_registry::register_code(const std::string_view code,
                                  const address_t& payout_address) {
  if (code.empty()) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  auto [it, inserted] = codes_.emplace(std::string{code}, payout_address);
  if (inserted) {
    spdlog::info("Registered code '{}' paying {}", code,
                 to_hex(payout_address));
  }
  return inserted;
}

bool code_registry::update_payout_address(const std::string_view code,
                                          const address_t& payout_address) {
  auto lock = std::scoped_lock{mutex_};
  auto it = codes_.find(code);
  if (it == std::end(codes_)) {
    return false;
  }
  it->second = payout_address;
  return true;
}

bool code_registry::is_registered(const std::string_view code) const {
  auto lock = std::scoped_lock{mutex_};
  return codes_.find(code) != std::end(codes_);
}

std::optional<address_t> code_registry::payout_address(
    const std::string_view code) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = codes_.find(code);
  if (it == std::end(codes_)) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace flywheel::hooks
