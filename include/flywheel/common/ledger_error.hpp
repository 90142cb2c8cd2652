#pragma once

#include <flywheel/schema/error_code.hpp>

#include <stdexcept>
#include <string>

namespace flywheel::common {

/// Raised inside an engine call to abort it; the engine converts it into an
/// `operation_result_t` after discarding pending writes.
class ledger_error final : public std::runtime_error {
 public:
  ledger_error(const flywheel::schema::error_code code,
               const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  flywheel::schema::error_code code() const { return code_; }

 private:
  flywheel::schema::error_code code_;
};

}  // namespace flywheel::common
