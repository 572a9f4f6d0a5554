#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <notary/blake3/hash.hpp>
#include <notary/execution/engine.hpp>
#include <notary/execution/native_ledger.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

struct node_options final {
  std::string db_path;
  std::string log_level;
  std::string log_file;
  std::string chain_id;
  std::string owner;
  std::string treasury;
  std::string storage_fee;
  std::vector<std::string> fund;
  std::string apply;
  uint64_t block_time_ms{};
  std::string query;
  std::string query_data;
};

void configure_logging(const node_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "notary", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

std::optional<notary::schema::account_id_t> parse_account(
    const std::string& value,
    const std::string_view name) {
  auto account = notary::schema::try_make_hash32(value);
  if (!account) {
    spdlog::error("--{} must be 64 hex characters", name);
  }
  return account;
}

bool fund_accounts(notary::execution::native_ledger& ledger,
                   const std::vector<std::string>& entries) {
  for (const auto& entry : entries) {
    auto separator = entry.find('=');
    if (separator == std::string::npos) {
      spdlog::error("--fund expects account=amount, got '{}'", entry);
      return false;
    }
    auto account = parse_account(entry.substr(0, separator), "fund");
    auto amount = notary::schema::try_make_amount(
        std::string_view{entry}.substr(separator + 1));
    if (!account || !amount) {
      spdlog::error("Invalid --fund entry '{}'", entry);
      return false;
    }
    ledger.credit(*account, *amount);
  }
  return true;
}

bool initialize_chain(notary::execution::engine& engine,
                      const node_options& options) {
  if (engine.info().chain_id != notary::schema::make_zero_hash()) {
    return true;
  }
  if (options.owner.empty() || options.treasury.empty()) {
    spdlog::warn("Chain not initialized; pass --owner and --treasury");
    return true;
  }

  auto genesis = notary::schema::genesis_state_t{};
  if (options.chain_id.empty()) {
    genesis.chain_id = notary::blake3::hash(std::string_view{"notary-ledger"});
  } else {
    auto chain_id = notary::schema::try_make_hash32(options.chain_id);
    if (!chain_id) {
      spdlog::error("--chain-id must be 64 hex characters");
      return false;
    }
    genesis.chain_id = *chain_id;
  }
  auto owner = parse_account(options.owner, "owner");
  auto treasury = parse_account(options.treasury, "treasury");
  auto fee = notary::schema::try_make_amount(options.storage_fee);
  if (!owner || !treasury || !fee) {
    if (!fee) {
      spdlog::error("--storage-fee must be a decimal uint256");
    }
    return false;
  }
  genesis.owner = *owner;
  genesis.treasury_account = *treasury;
  genesis.storage_fee = *fee;
  return engine.init_chain(genesis);
}

bool apply_blocks(notary::execution::engine& engine,
                  const node_options& options) {
  auto input = std::ifstream{options.apply};
  if (!input) {
    spdlog::error("Unable to open block file '{}'", options.apply);
    return false;
  }

  auto block_time = options.block_time_ms;
  auto line = std::string{};
  while (std::getline(input, line)) {
    auto stream = std::istringstream{line};
    auto txs = std::vector<notary::schema::bytes_t>{};
    auto hex = std::string{};
    while (stream >> hex) {
      auto tx = notary::schema::try_from_hex(hex);
      if (!tx) {
        spdlog::error("Block file contains invalid hex '{}'", hex);
        return false;
      }
      txs.push_back(std::move(*tx));
    }
    if (txs.empty()) {
      continue;
    }

    auto height =
        static_cast<uint64_t>(engine.info().last_block_height) + 1;
    auto block = engine.finalize_block(height, block_time, txs);
    for (std::size_t i = 0; i < block.tx_results.size(); ++i) {
      const auto& result = block.tx_results[i];
      if (result.code == 0) {
        spdlog::info("Block {} tx {}: ok ({} event(s))", height, i,
                     result.events.size());
      } else {
        spdlog::warn("Block {} tx {}: code {} [{}] {}", height, i, result.code,
                     notary::schema::to_string(
                         notary::schema::category_of(result.code)),
                     result.log);
      }
    }
    engine.commit();
    block_time += 1000;
  }
  return true;
}

void run_query(notary::execution::engine& engine, const node_options& options) {
  auto data = notary::schema::try_from_hex(options.query_data);
  if (!data) {
    spdlog::error("--query-data must be hex");
    return;
  }
  auto result = engine.query(
      options.query, notary::schema::bytes_view_t{data->data(), data->size()});
  std::cout << "code: " << result.code << '\n'
            << "log: " << result.log << '\n'
            << "height: " << result.height << '\n'
            << "value: "
            << notary::schema::to_hex(notary::schema::bytes_view_t{
                   result.value.data(), result.value.size()})
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = node_options{};
  auto config_path = std::string{};

  auto vm = po::variables_map{};
  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "Path to a configuration file");

  auto node = po::options_description{"Notary"};
  node.add_options()(
      "db-path", po::value<std::string>(&options.db_path)
                     ->default_value("notary-data"),
      "RocksDB state directory")(
      "log-level", po::value<std::string>(&options.log_level)
                       ->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&options.log_file)
                      ->default_value("notary.log"),
      "Log file path")("chain-id", po::value<std::string>(&options.chain_id),
                       "Genesis chain id (64 hex chars)")(
      "owner", po::value<std::string>(&options.owner),
      "Genesis owner account (64 hex chars)")(
      "treasury", po::value<std::string>(&options.treasury),
      "Genesis treasury account (64 hex chars)")(
      "storage-fee", po::value<std::string>(&options.storage_fee)
                         ->default_value("0"),
      "Genesis storage fee (decimal)")(
      "fund", po::value<std::vector<std::string>>(&options.fund)->composing(),
      "Native balance for the in-process value rail, account=amount. "
      "Balances live in memory only and are credited again on every start")(
      "apply", po::value<std::string>(&options.apply),
      "File of hex transactions, one block per line")(
      "block-time-ms", po::value<uint64_t>(&options.block_time_ms)
                           ->default_value(0),
      "Block time of the first applied block (never earlier than the last "
      "committed block time)")(
      "query", po::value<std::string>(&options.query), "Query path")(
      "query-data", po::value<std::string>(&options.query_data)
                        ->default_value(""),
      "Query data (hex)");

  auto description = po::options_description{"notaryd"};
  description.add(generic).add(node);

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "Unable to open config file" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, node), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  configure_logging(options);

  auto exit_code = 0;
  {
    auto ledger = notary::execution::native_ledger{};
    auto engine = notary::execution::engine{options.db_path};
    engine.set_balance_reader(ledger.balance_reader());
    engine.set_value_transfer(ledger.value_transfer());

    if (!options.fund.empty() && engine.info().last_block_height > 0) {
      spdlog::warn("Native balances are not persisted; --fund starts a fresh "
                   "in-memory book at height {}",
                   engine.info().last_block_height);
    }
    if (!fund_accounts(ledger, options.fund) ||
        !initialize_chain(engine, options)) {
      exit_code = 1;
    } else if (!options.apply.empty() && !apply_blocks(engine, options)) {
      exit_code = 1;
    } else if (!options.query.empty()) {
      run_query(engine, options);
    }

    auto info = engine.info();
    spdlog::info("Height {} state root {}", info.last_block_height,
                 notary::schema::to_hex(info.last_block_state_root));
  }

  spdlog::shutdown();
  return exit_code;
}
