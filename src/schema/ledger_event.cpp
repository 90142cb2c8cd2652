#include <flywheel/schema/ledger_event.hpp>

namespace flywheel::schema {

std::string_view event_name(const ledger_event_t& event) {
  return std::visit(
      overloaded{
          [](const campaign_created_t&) -> std::string_view {
            return "campaign_created";
          },
          [](const campaign_status_updated_t&) -> std::string_view {
            return "campaign_status_updated";
          },
          [](const campaign_metadata_updated_t&) -> std::string_view {
            return "campaign_metadata_updated";
          },
          [](const contract_uri_updated_t&) -> std::string_view {
            return "contract_uri_updated";
          },
          [](const payout_allocated_t&) -> std::string_view {
            return "payout_allocated";
          },
          [](const payouts_deallocated_t&) -> std::string_view {
            return "payouts_deallocated";
          },
          [](const payout_sent_t&) -> std::string_view {
            return "payout_sent";
          },
          [](const payouts_distributed_t&) -> std::string_view {
            return "payouts_distributed";
          },
          [](const fee_sent_t&) -> std::string_view { return "fee_sent"; },
          [](const fee_allocated_t&) -> std::string_view {
            return "fee_allocated";
          },
          [](const fee_transfer_failed_t&) -> std::string_view {
            return "fee_transfer_failed";
          },
          [](const fees_distributed_t&) -> std::string_view {
            return "fees_distributed";
          },
          [](const funds_withdrawn_t&) -> std::string_view {
            return "funds_withdrawn";
          }},
      event);
}

}  // namespace flywheel::schema
