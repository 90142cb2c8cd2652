#pragma once

#include <flywheel/schema/ledger_event.hpp>
#include <flywheel/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Flattened, string-typed view of a ledger event for log output and
// indexers.
namespace flywheel::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

transaction_event_t to_transaction_event(const ledger_event_t& event);

}  // namespace flywheel::schema
