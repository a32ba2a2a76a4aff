#include "payments_engine_impl.hpp"
#include "config/engine_config.hpp"
#include "io/csv_reader.hpp"
#include "io/snapshot_writer.hpp"
#include "observability/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [options]\n"
            << "  --config <file>       JSON configuration file\n"
            << "  --format <csv|json>   snapshot format (default: csv)\n"
            << "  --log-level <level>   debug, info, warn, error or fatal (default: warn)\n"
            << "  --metrics <file>      write Prometheus metrics to <file> after the run\n";
}

struct CommandLine {
  std::string input_path;
  std::string config_path;
  std::optional<std::string> format;
  std::optional<std::string> log_level;
  std::optional<std::string> metrics_path;
};

// Returns false and sets `error` on unknown options or missing option values.
bool parseCommandLine(int argc, char* argv[], CommandLine& cmd, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](const char* option) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        error = std::string("missing value for ") + option;
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "--config") {
      auto v = value("--config");
      if (!v) return false;
      cmd.config_path = *v;
    } else if (arg == "--format") {
      if (!(cmd.format = value("--format"))) return false;
    } else if (arg == "--log-level") {
      if (!(cmd.log_level = value("--log-level"))) return false;
    } else if (arg == "--metrics") {
      if (!(cmd.metrics_path = value("--metrics"))) return false;
    } else if (arg.size() > 1 && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else if (cmd.input_path.empty()) {
      cmd.input_path = arg;
    } else {
      error = "unexpected argument: " + arg;
      return false;
    }
  }
  return true;
}

// Loads the config file, if any, then applies command-line overrides.
bool resolveConfig(const CommandLine& cmd, payments::config::EngineConfig& cfg,
                   std::string& error) {
  using namespace payments;

  if (!cmd.config_path.empty()) {
    auto result = config::ConfigLoader::load(cmd.config_path);
    if (!result.success) {
      error = result.error;
      return false;
    }
    cfg = std::move(result.config);
  }

  if (cmd.format) {
    auto format = config::outputFormatFromString(*cmd.format);
    if (!format) {
      error = "unknown format: " + *cmd.format;
      return false;
    }
    cfg.output_format = *format;
  }
  if (cmd.log_level) {
    auto level = observability::logLevelFromString(*cmd.log_level);
    if (!level) {
      error = "unknown log level: " + *cmd.log_level;
      return false;
    }
    cfg.log_level = *level;
  }
  if (cmd.metrics_path) {
    cfg.metrics_path = *cmd.metrics_path;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payments;

  CommandLine cmd;
  std::string error;
  if (!parseCommandLine(argc, argv, cmd, error)) {
    std::cerr << "Error: " << error << "\n";
    printUsage(argv[0]);
    return 2;
  }
  if (cmd.input_path.empty()) {
    printUsage(argv[0]);
    return 2;
  }

  if (!std::filesystem::is_regular_file(cmd.input_path)) {
    std::cerr << "Error: '" << cmd.input_path << "' is not a valid file\n";
    return 1;
  }

  config::EngineConfig cfg;
  if (!resolveConfig(cmd, cfg, error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }
  observability::Logger::getInstance().setLogLevel(cfg.log_level);

  try {
    auto reader = io::CsvTransactionReader::open(cmd.input_path);

    PaymentsEngineImpl engine(cfg.rules);
    engine.ProcessAll(*reader);

    io::SnapshotWriter writer(cfg.output_format);
    writer.write(std::cout, engine.Snapshot());
    std::cout.flush();

    if (!cfg.metrics_path.empty()) {
      std::ofstream metrics_file(cfg.metrics_path);
      if (!metrics_file) {
        PAYMENTS_LOG_BUILDER(observability::LogLevel::ERROR, "cannot write metrics file")
            .field("path", cfg.metrics_path);
        return 1;
      }
      metrics_file << engine.metrics().exportMetrics();
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
