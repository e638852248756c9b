#include "command_line.hpp"
#include "utils/utils.hpp"

#include <sstream>

namespace cli {

CommandLineOptions parse_command_line(const std::vector<std::string> &args,
                                      std::vector<std::string> &errors) {
  CommandLineOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      continue;
    }
    if (arg == "--compare") {
      options.compare_reference = true;
      continue;
    }

    bool takes_value = arg == "--input" || arg == "--format" ||
                       arg == "--ddof" || arg == "--workers" ||
                       arg == "--column" || arg == "--stream";
    if (takes_value) {
      if (i + 1 >= args.size()) {
        errors.push_back("Missing value for " + arg);
        continue;
      }
      const std::string &value = args[++i];

      if (arg == "--input") {
        options.input_path = value;
      } else if (arg == "--format") {
        options.output_format = Utils::to_lower_copy(value);
      } else if (arg == "--stream") {
        options.stream_name = value;
      } else if (arg == "--ddof") {
        options.ddof = Utils::string_to_number<uint32_t>(value);
        if (!options.ddof)
          errors.push_back("Invalid --ddof value: " + value);
      } else if (arg == "--workers") {
        options.worker_count = Utils::string_to_number<uint32_t>(value);
        if (!options.worker_count)
          errors.push_back("Invalid --workers value: " + value);
      } else if (arg == "--column") {
        options.column = Utils::string_to_number<int>(value);
        if (!options.column)
          errors.push_back("Invalid --column value: " + value);
      }
      continue;
    }

    if (!arg.empty() && arg[0] == '-' && arg != "-") {
      errors.push_back("Unknown option: " + arg);
      continue;
    }

    if (options.config_path)
      errors.push_back("Unexpected extra argument: " + arg);
    else
      options.config_path = arg;
  }

  return options;
}

void apply_overrides(const CommandLineOptions &options,
                     Config::AppConfig &config) {
  if (options.input_path)
    config.input_path = *options.input_path;
  if (options.output_format)
    config.output_format = *options.output_format;
  if (options.stream_name)
    config.stream_name = *options.stream_name;
  if (options.ddof)
    config.ddof = *options.ddof;
  if (options.worker_count)
    config.ingest.worker_count = *options.worker_count;
  if (options.column)
    config.reader.column = *options.column;
  if (options.compare_reference)
    config.compare_reference = true;
}

std::string usage(const std::string &program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " [config.ini] [options]\n"
      << "\n"
      << "Reads one number per line and reports its running mean and "
         "variance.\n"
      << "\n"
      << "Options:\n"
      << "  --input PATH     Value source, '-' for stdin\n"
      << "  --format F       text, json or prometheus\n"
      << "  --stream NAME    Stream label used in the report\n"
      << "  --ddof N         0 = population variance, 1 = sample variance\n"
      << "  --workers N      Number of ingestion worker threads\n"
      << "  --column N       Zero-based CSV column to read\n"
      << "  --compare        Also report two-pass and semi-naive variance\n"
      << "  -h, --help       Show this message\n";
  return out.str();
}

} // namespace cli
