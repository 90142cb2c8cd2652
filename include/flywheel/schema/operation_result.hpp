#pragma once

#include <flywheel/schema/ledger_event.hpp>
#include <flywheel/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Outcome of one engine call. `code` 0 means the call committed; any other
// code means no state changed and `codespace` names who raised it.
namespace flywheel::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::vector<ledger_event_t> events;
  std::optional<address_t> campaign;
};

using operation_result_t = operation_result<1>;

}  // namespace flywheel::schema
