#include <boost/program_options.hpp>
#include <flywheel/common/critical.hpp>
#include <flywheel/execution/campaign_address.hpp>
#include <flywheel/execution/engine.hpp>
#include <flywheel/schema/transaction_event.hpp>
#include <flywheel/storage/rocksdb/storage.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "flywheel_tool", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

void print_help(const po::options_description& options) {
  std::cout << "Usage: flywheel_tool <command> [options]\n\n"
            << "Commands:\n"
            << "  predict     campaign address for --hooks --nonce --payload\n"
            << "  status      status and hooks of --campaign\n"
            << "  totals      allocated payout and fee totals of --campaign "
               "--asset\n"
            << "  allocation  allocated payout and fee of --campaign --asset "
               "--key\n"
            << "  events      event log entries --from through --to\n\n"
            << options << '\n';
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    flywheel::common::critical("missing required --" + name);
  }
  return vm[name].as<std::string>();
}

flywheel::schema::address_t get_address(const po::variables_map& vm,
                                        const std::string& name) {
  auto value = require(vm, name);
  if (value == "native") {
    return flywheel::schema::kNativeToken;
  }
  auto address = flywheel::schema::try_make_address(value);
  if (!address) {
    flywheel::common::critical("--" + name + " must be a 20-byte hex address");
  }
  return *address;
}

flywheel::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  auto hash = flywheel::schema::try_make_hash32(require(vm, name));
  if (!hash) {
    flywheel::common::critical("--" + name + " must be 32-byte hex");
  }
  return *hash;
}

flywheel::schema::nonce_t get_nonce(const po::variables_map& vm) {
  auto value = vm["nonce"].as<std::string>();
  try {
    return flywheel::schema::nonce_t{value};
  } catch (const std::runtime_error& ex) {
    spdlog::error("Invalid nonce '{}': {}", value, ex.what());
    flywheel::common::critical("--nonce must be a decimal integer");
  }
}

std::string hex(const flywheel::schema::bytes_view_t& bytes) {
  return "0x" + flywheel::schema::to_hex(bytes);
}

int run_predict(const po::variables_map& vm) {
  auto payload = flywheel::schema::try_from_hex(
      vm["payload"].as<std::string>());
  if (!payload) {
    flywheel::common::critical("--payload must be hex");
  }
  auto campaign = flywheel::execution::predict_campaign_address(
      get_address(vm, "hooks"), get_nonce(vm),
      flywheel::schema::make_bytes_view(*payload));
  std::cout << hex(campaign) << '\n';
  return 0;
}

int run_query(const std::string& command, const po::variables_map& vm) {
  auto db_path = vm["db-path"].as<std::string>();
  auto storage =
      flywheel::storage::make_storage<flywheel::storage::rocksdb_storage_tag>(
          db_path);
  auto options = flywheel::execution::engine_options_t{
      .address = get_address(vm, "registry"), .db_path = db_path};
  auto ledger = flywheel::execution::engine{storage, options};

  if (command == "status") {
    auto campaign = get_address(vm, "campaign");
    auto status = ledger.campaign_status(campaign);
    if (!status) {
      std::cout << "campaign " << hex(campaign) << " does not exist\n";
      return 1;
    }
    std::cout << "status: " << flywheel::schema::to_string(*status) << '\n'
              << "hooks: " << hex(*ledger.campaign_hooks(campaign)) << '\n';
    return 0;
  }

  if (command == "totals") {
    auto campaign = get_address(vm, "campaign");
    auto asset = get_address(vm, "asset");
    std::cout << "payouts: "
              << ledger.total_allocated_payouts(campaign, asset).str() << '\n'
              << "fees: " << ledger.total_allocated_fees(campaign, asset).str()
              << '\n'
              << "balance: " << ledger.balance_of(asset, campaign).str()
              << '\n';
    return 0;
  }

  if (command == "allocation") {
    auto campaign = get_address(vm, "campaign");
    auto asset = get_address(vm, "asset");
    auto key = get_hash32(vm, "key");
    std::cout << "payout: "
              << ledger.allocated_payout(campaign, asset, key).str() << '\n'
              << "fee: " << ledger.allocated_fee(campaign, asset, key).str()
              << '\n';
    return 0;
  }

  for (const auto& record : ledger.events(vm["from"].as<uint64_t>(),
                                          vm["to"].as<uint64_t>())) {
    auto event = flywheel::schema::to_transaction_event(record.event);
    std::cout << record.sequence << ' ' << record.recorded_at << ' '
              << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"flywheel_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "predict|status|totals|allocation|events")(
      "db-path", po::value<std::string>()->default_value("flywheel-data"),
      "ledger RocksDB directory")("registry", po::value<std::string>(),
                                  "registry address hex")(
      "log-level", po::value<std::string>()->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("flywheel_tool.log"),
      "log file path")("hooks", po::value<std::string>(), "hooks address hex")(
      "nonce", po::value<std::string>()->default_value("0"),
      "creation nonce (decimal)")(
      "payload", po::value<std::string>()->default_value(""),
      "creation payload hex")("campaign", po::value<std::string>(),
                              "campaign address hex")(
      "asset", po::value<std::string>(), "asset address hex or 'native'")(
      "key", po::value<std::string>(), "recipient key hash32 hex")(
      "from", po::value<uint64_t>()->default_value(1), "first event sequence")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "last event sequence");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(vm["log-level"].as<std::string>(),
                    vm["log-file"].as<std::string>());

  auto code = 0;
  if (command == "predict") {
    code = run_predict(vm);
  } else if (command == "status" || command == "totals" ||
             command == "allocation" || command == "events") {
    code = run_query(command, vm);
  } else {
    flywheel::common::critical(
        "command must be predict|status|totals|allocation|events");
  }
  spdlog::shutdown();
  return code;
}
