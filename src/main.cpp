#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <tranche/execution/engine.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/storage/rocksdb/storage.hpp>

namespace {

std::optional<tranche::schema::hash32_t> parse_identity(
    const std::string& name,
    const std::string& hex) {
  if (hex.empty()) {
    return tranche::schema::make_zero_hash();
  }
  auto parsed = tranche::schema::try_make_hash32(hex);
  if (!parsed) {
    spdlog::error("{} must be 64 hex characters", name);
  }
  return parsed;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto chain_id_hex = std::string{};
  auto genesis_admin_hex = std::string{};
  auto config_file = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto strict_crypto = true;

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Tranche"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "Optional config file with the same keys")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "tranche.db"),
      "RocksDB directory")(
      "chain-id",
      boost::program_options::value<std::string>(&chain_id_hex)->required(),
      "Chain id as 64 hex characters")(
      "genesis-admin",
      boost::program_options::value<std::string>(&genesis_admin_hex),
      "Account granted the admin role at genesis, 64 hex characters")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "tranche.log"),
      "Log file path")("replay",
                       "Replay persisted history and verify the state root");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto stream = std::ifstream{vm["config"].as<std::string>()};
      if (!stream) {
        std::cerr << "Cannot open config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(stream, description), vm);
    }
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tranche", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto chain_id = parse_identity("chain-id", chain_id_hex);
  auto genesis_admin = parse_identity("genesis-admin", genesis_admin_hex);
  if (!chain_id || !genesis_admin) {
    spdlog::shutdown();
    return 1;
  }

  auto encoder = tranche::schema::encoding::encoder<
      tranche::schema::encoding::scale_encoder_tag>{};
  auto storage = tranche::storage::make_storage<
      tranche::storage::rocksdb_storage_tag>(db_path);
  auto engine = tranche::execution::engine{
      encoder, storage,
      tranche::execution::engine_config_t{
          .chain_id = *chain_id,
          .genesis_admin = *genesis_admin,
          .require_strict_crypto = strict_crypto}};

  auto info = engine.info();
  spdlog::info("{} {} at height {} state root {}", info.data, info.version,
               info.last_block_height,
               tranche::schema::to_hex(info.last_block_state_root));

  auto exit_code = 0;
  if (vm.contains("replay")) {
    auto replayed = engine.replay_history();
    if (replayed.ok) {
      spdlog::info("Replay verified {} transaction(s), {} applied",
                   replayed.tx_count, replayed.applied_count);
    } else {
      spdlog::error("Replay failed at height {}: {}", replayed.last_height,
                    replayed.error);
      exit_code = 2;
    }
  }

  spdlog::shutdown();
  return exit_code;
}
