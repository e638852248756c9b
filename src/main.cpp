#include "cli/command_line.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/stats_errors.hpp"
#include "ingest/sharded_ingestor.hpp"
#include "io/value_readers/base_value_reader.hpp"
#include "io/value_readers/file_value_reader.hpp"
#include "io/value_readers/recording_value_reader.hpp"
#include "io/value_readers/stream_value_reader.hpp"
#include "report/report_formatter.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_NO_DATA = 2;

std::unique_ptr<IValueReader> make_reader(const Config::AppConfig &config) {
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Initializing value reader for input: " << config.input_path);
  if (config.input_path == "-")
    return std::make_unique<StreamValueReader>(std::cin, config.reader);
  return std::make_unique<FileValueReader>(config.input_path, config.reader);
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);
  std::cin.tie(nullptr);

  const std::string program_name = argc > 0 ? argv[0] : "streamstat";
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  std::vector<std::string> arg_errors;
  cli::CommandLineOptions options = cli::parse_command_line(args, arg_errors);
  if (options.show_help) {
    std::cout << cli::usage(program_name);
    return 0;
  }
  if (!arg_errors.empty()) {
    for (const auto &error : arg_errors)
      std::cerr << "Error: " << error << std::endl;
    std::cerr << cli::usage(program_name);
    return EXIT_USAGE;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (options.config_path &&
      !config_manager.load_configuration(*options.config_path)) {
    std::cerr << "Error: configuration file '" << *options.config_path
              << "' could not be used." << std::endl;
    return EXIT_USAGE;
  }

  Config::AppConfig config = *config_manager.get_config();
  cli::apply_overrides(options, config);

  std::vector<std::string> validation_errors;
  if (!Config::validate_app_config(config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors)
      std::cerr << "  - " << error << std::endl;
    return EXIT_USAGE;
  }

  // --- Initialize Logging ---
  LogManager::instance().configure(config.logging);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "streamstat starting: stream '" << config.stream_name << "', format "
                                      << config.output_format << ", ddof "
                                      << config.ddof);

  try {
    std::unique_ptr<IValueReader> source = make_reader(config);
    std::unique_ptr<RecordingValueReader> recorder;
    IValueReader *reader = source.get();
    if (config.compare_reference) {
      recorder = std::make_unique<RecordingValueReader>(*source);
      reader = recorder.get();
    }

    ingest::ShardedIngestor ingestor(config.ingest.worker_count,
                                     config.ingest.queue_capacity_batches);
    ingest::IngestResult result = ingestor.run(*reader);

    report::MomentSummary summary = report::summarize(
        config.stream_name, result.accumulator, config.ddof, result.rejected);
    if (recorder)
      report::attach_reference_comparison(summary, recorder->recorded());

    std::cout << report::format_summary(summary, config.output_format);
    if (config.output_format == "json")
      std::cout << '\n';
    std::cout.flush();

    if (result.accumulator.empty()) {
      LOG(LogLevel::ERROR, LogComponent::CORE,
          "Input contained no valid observation.");
      return EXIT_NO_DATA;
    }
  } catch (const stats::StatsError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Statistics error: " << e.what());
    return EXIT_NO_DATA;
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Fatal error: " << e.what());
    return EXIT_USAGE;
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "streamstat finished.");
  return 0;
}
