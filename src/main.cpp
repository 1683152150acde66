#include "common/logging.h"
#include "market/engine_config.h"
#include "market/fraud_scoring.h"
#include "market/operation_replay.h"
#include "market/trust_engine.h"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace tradeguard;
using json = nlohmann::json;

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " <command> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  score                      Print the fraud risk score of a "
               "listing"
            << std::endl;
  std::cout << "  replay FILE                Apply a JSON array of operations "
               "in order"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Score Options:" << std::endl;
  std::cout << "  --price P                  Listing price" << std::endl;
  std::cout << "  --reputation R             Seller reputation" << std::endl;
  std::cout << "  --category C               Listing category" << std::endl;
  std::cout << std::endl;
  std::cout << "Replay Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON engine configuration"
            << std::endl;
  std::cout << "  --snapshot-in FILE         Load engine state before replaying"
            << std::endl;
  std::cout << "  --snapshot-out FILE        Write engine state after replaying"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Global Options:" << std::endl;
  std::cout
      << "  --log-level LEVEL          Log level (trace, debug, info, warn, "
         "error, critical)"
      << std::endl;
  std::cout << "  --log-json                 Emit structured JSON log lines"
            << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
}

struct CliOptions {
  std::string command;
  std::string replay_file;
  std::string config_file;
  std::string snapshot_in;
  std::string snapshot_out;
  std::string log_level;
  bool log_json = false;

  uint64_t price = 0;
  uint64_t reputation = 0;
  std::string category;
  bool has_price = false;
  bool has_reputation = false;
  bool has_category = false;
};

bool parse_u64(const std::string &text, uint64_t &out) {
  if (text.empty() || text[0] == '-') {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return false;
  }
  out = static_cast<uint64_t>(value);
  return true;
}

// Returns 0 on success, otherwise the process exit code
int parse_arguments(int argc, char *argv[], CliOptions &options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--log-level" && i + 1 < argc) {
      options.log_level = argv[++i];
    } else if (arg == "--log-json") {
      options.log_json = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_file = argv[++i];
    } else if (arg == "--snapshot-in" && i + 1 < argc) {
      options.snapshot_in = argv[++i];
    } else if (arg == "--snapshot-out" && i + 1 < argc) {
      options.snapshot_out = argv[++i];
    } else if (arg == "--price" && i + 1 < argc) {
      if (!parse_u64(argv[++i], options.price)) {
        std::cerr << "Invalid --price: " << argv[i] << std::endl;
        return 2;
      }
      options.has_price = true;
    } else if (arg == "--reputation" && i + 1 < argc) {
      if (!parse_u64(argv[++i], options.reputation)) {
        std::cerr << "Invalid --reputation: " << argv[i] << std::endl;
        return 2;
      }
      options.has_reputation = true;
    } else if (arg == "--category" && i + 1 < argc) {
      options.category = argv[++i];
      options.has_category = true;
    } else if (options.command.empty() && arg.rfind("--", 0) != 0) {
      options.command = arg;
    } else if (options.command == "replay" && options.replay_file.empty() &&
               arg.rfind("--", 0) != 0) {
      options.replay_file = arg;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage(argv[0]);
      return 2;
    }
  }
  return 0;
}

int run_score(const CliOptions &options) {
  if (!options.has_price || !options.has_reputation || !options.has_category) {
    std::cerr << "score requires --price, --reputation and --category"
              << std::endl;
    return 2;
  }

  std::cout << market::FraudScoringEngine::score(
                   options.price, options.reputation, options.category)
            << std::endl;
  return 0;
}

int run_replay(const CliOptions &options, const market::EngineConfig &config) {
  if (options.replay_file.empty()) {
    std::cerr << "replay requires an operations FILE" << std::endl;
    return 2;
  }

  market::TrustEngine engine;
  auto configured = engine.apply_config(config);
  if (configured.is_err()) {
    std::cerr << "Configuration rejected: " << configured.error() << std::endl;
    return 1;
  }

  if (!options.snapshot_in.empty()) {
    auto loaded = engine.load_snapshot(options.snapshot_in);
    if (loaded.is_err()) {
      std::cerr << "Failed to load snapshot: " << loaded.error() << std::endl;
      return 1;
    }
  }

  std::ifstream file(options.replay_file);
  if (!file.is_open()) {
    std::cerr << "Cannot open " << options.replay_file << std::endl;
    return 1;
  }
  json operations = json::parse(file, nullptr, false);
  if (operations.is_discarded() || !operations.is_array()) {
    std::cerr << options.replay_file << " must contain a JSON array of operations"
              << std::endl;
    return 1;
  }

  auto summary = market::replay_operations(engine, operations, std::cout);
  LOG_INFO("cli", "Replayed ", operations.size(), " operations: ",
           summary.applied, " applied, ", summary.rejected, " rejected, ",
           summary.malformed, " malformed");

  if (!options.snapshot_out.empty()) {
    auto saved = engine.save_snapshot(options.snapshot_out);
    if (saved.is_err()) {
      std::cerr << "Failed to write snapshot: " << saved.error() << std::endl;
      return 1;
    }
  }

  std::cout << "state_digest " << engine.state_digest() << std::endl;
  return summary.malformed == 0 ? 0 : 1;
}

int main(int argc, char *argv[]) {
  // Keep stdout for command output
  common::Logger::instance().set_output(&std::cerr);

  CliOptions options;
  int parse_status = parse_arguments(argc, argv, options);
  if (parse_status != 0) {
    return parse_status;
  }

  market::EngineConfig config = market::EngineConfigManager::create_default();
  if (!options.config_file.empty()) {
    auto loaded = market::EngineConfigManager::load_from_file(options.config_file);
    if (loaded.is_err()) {
      std::cerr << "Failed to load configuration: " << loaded.error()
                << std::endl;
      return 1;
    }
    config = loaded.value();
  }

  // Command line overrides the configuration file
  std::string level_name =
      options.log_level.empty() ? config.log_level : options.log_level;
  auto level = common::parse_log_level(level_name);
  if (!level.has_value()) {
    std::cerr << "Invalid log level: " << level_name << std::endl;
    return 2;
  }
  common::Logger::instance().set_level(*level);
  common::Logger::instance().set_json_format(options.log_json ||
                                             config.log_json);
  if (options.command == "score") {
    return run_score(options);
  }
  if (options.command == "replay") {
    return run_replay(options, config);
  }

  if (!options.command.empty()) {
    std::cerr << "Unknown command: " << options.command << std::endl;
  }
  print_usage(argv[0]);
  return 2;
}
