#include <cpptrace/cpptrace.hpp>
#include <chrono>
#include <filesystem>
#include <string>

#include "command_line_parser.hpp"
#include "flatten_engine.hpp"
#include "log.hpp"
#include "run_configuration.hpp"
#include "settings_manager.hpp"

namespace {

constexpr const char* kRule = "--------------------------------------------------";

void print_run_header(Logger& logger,
                      const SettingsManager& settings,
                      const RunConfiguration& config) {
  logger.info("Starting universal recursive flattening process...");
  logger.info("  Source Root: '{}'", settings.get<std::string>("source_dir"));
  logger.info("  Destination: '{}'", settings.get<std::string>("destination_dir"));
  logger.info("  Action: '{}'", transfer_action_name(config.action));
  logger.info("  Workers: {}", config.worker_count);
  logger.info("  Separator: '{}'", config.separator);
  if(config.verify_hash) {
    logger.info("  SHA256 hash verification is ENABLED.");
  }
  for(const auto& key : settings.keys()) {
    logger.debug("  setting {} = {}", key, settings.value_as_string(key));
  }
  print_out(nullptr, "{}", kRule);
}

void print_run_summary(Logger& logger,
                       const FlattenEngine::Stats& stats,
                       TransferAction action,
                       bool success,
                       double seconds) {
  print_out(nullptr, "{}", kRule);
  logger.info("Files transferred: {}, failed: {}", stats.files_transferred, stats.files_failed);
  logger.info("Directories created: {}, collapsed: {}, skipped: {}",
              stats.directories_created, stats.directories_collapsed, stats.directories_skipped);
  for(const auto& failure : stats.failures) {
    logger.error("  Failed: '{}': {}", failure.relative_display_path, failure.error_detail);
  }
  if(success) {
    logger.info("Process ({}) completed successfully in {:.2f} seconds.", transfer_action_name(action), seconds);
  } else {
    logger.error("Process ({}) completed with errors in {:.2f} seconds.", transfer_action_name(action), seconds);
  }
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "flatten");
    try {
      parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    bool debug = settings.get<bool>("debug");
    init(settings.get<bool>("verbose") || debug, debug);
    auto logger = std::make_shared<Logger>("flatten");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      } else {
        logger->info("Settings saved to {}", settings.settings_path().string());
      }
    }

    auto source_dir = settings.get<std::string>("source_dir");
    auto destination_dir = settings.get<std::string>("destination_dir");
    if(source_dir.empty() || destination_dir.empty()) {
      if(settings.save_requested()) return 0;
      print_err(nullptr, "Both source_dir and destination_dir are required");
      parser.usage();
      return 1;
    }

    RunConfiguration config;
    try {
      config = run_configuration_from_settings(settings);
    } catch(const std::exception& e) {
      logger->error("{}", e.what());
      return 1;
    }
    if(!config.rules.empty()) {
      logger->info("Loaded {} sanitization rules from '{}'.", config.rules.size(),
                   settings.get<std::string>("rules"));
    }

    print_run_header(*logger, settings, config);

    FlattenEngine engine(config, logger);
    auto start = std::chrono::steady_clock::now();
    bool success = false;
    try {
      success = engine.run(source_dir, destination_dir);
      if(!success) {
        logger->error("Processing failed at some point.");
      }
    } catch(const FlattenError& e) {
      logger->error("{}", e.what());
      return 1;
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    print_run_summary(*logger, engine.stats(), config.action, success, elapsed.count());
    return success ? 0 : 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("flatten-main");
    logger.error("An unexpected error occurred: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
