#include <flywheel/schema/transaction_event.hpp>

#include <utility>

namespace flywheel::schema {

namespace {

struct attribute_writer final {
  transaction_event_t& out;

  void add(std::string key, std::string value, const bool index = false) {
    out.attributes.push_back(transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = index});
  }

  void campaign(const address_t& value) { add("campaign", to_hex(value), true); }
  void asset(const address_t& value) { add("asset", to_hex(value), true); }
  void key(const hash32_t& value) { add("key", to_hex(value), true); }
  void recipient(const address_t& value) {
    add("recipient", to_hex(value), true);
  }
  void amount(const amount_t& value) { add("amount", value.str()); }
  void extra_data(const bytes_t& value) {
    if (!value.empty()) {
      add("extra_data", to_hex(value));
    }
  }
};

}  // namespace

transaction_event_t to_transaction_event(const ledger_event_t& event) {
  auto out = transaction_event_t{};
  out.type = std::string{event_name(event)};
  auto writer = attribute_writer{out};

  std::visit(
      overloaded{
          [&](const campaign_created_t& value) {
            writer.campaign(value.campaign);
            writer.add("hooks", to_hex(value.hooks), true);
          },
          [&](const campaign_status_updated_t& value) {
            writer.campaign(value.campaign);
            writer.add("sender", to_hex(value.sender));
            writer.add("old_status", std::string{to_string(value.old_status)});
            writer.add("new_status", std::string{to_string(value.new_status)});
          },
          [&](const campaign_metadata_updated_t& value) {
            writer.campaign(value.campaign);
            writer.add("uri", value.uri);
          },
          [&](const contract_uri_updated_t& value) {
            writer.campaign(value.campaign);
          },
          [&](const payout_allocated_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.key(value.key);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const payouts_deallocated_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.key(value.key);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const payout_sent_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.recipient(value.recipient);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const payouts_distributed_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.key(value.key);
            writer.recipient(value.recipient);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const fee_sent_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.recipient(value.recipient);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const fee_allocated_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.key(value.key);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const fee_transfer_failed_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.key(value.key);
            writer.recipient(value.recipient);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const fees_distributed_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.key(value.key);
            writer.recipient(value.recipient);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          },
          [&](const funds_withdrawn_t& value) {
            writer.campaign(value.campaign);
            writer.asset(value.asset);
            writer.recipient(value.recipient);
            writer.amount(value.amount);
            writer.extra_data(value.extra_data);
          }},
      event);

  return out;
}

}  // namespace flywheel::schema
