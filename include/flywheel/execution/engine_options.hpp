#pragma once

#include <flywheel/schema/primitives.hpp>

#include <string>

namespace flywheel::execution {

struct engine_options_t final {
  /// The registry's own address; hooks only accept calls from it and every
  /// vault names it as controller.
  flywheel::schema::address_t address{};
  /// RocksDB directory holding ledger state.
  std::string db_path{"flywheel-data"};
};

}  // namespace flywheel::execution
