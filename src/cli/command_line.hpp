#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "core/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cli {

// Flags given on the command line. Each set field overrides the config file.
struct CommandLineOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> input_path;
  std::optional<std::string> output_format;
  std::optional<std::string> stream_name;
  std::optional<uint32_t> ddof;
  std::optional<uint32_t> worker_count;
  std::optional<int> column;
  bool compare_reference = false;
  bool show_help = false;
};

/**
 * Parses argv (without the program name). A single positional argument is
 * taken as the config file path.
 * @param errors Receives one message per unusable argument
 */
CommandLineOptions parse_command_line(const std::vector<std::string> &args,
                                      std::vector<std::string> &errors);

void apply_overrides(const CommandLineOptions &options,
                     Config::AppConfig &config);

std::string usage(const std::string &program_name);

} // namespace cli

#endif // COMMAND_LINE_HPP
