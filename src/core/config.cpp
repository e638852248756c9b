#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

std::optional<LogLevel> string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 [](unsigned char ch) { return std::toupper(ch); });
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return std::nullopt;
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"stats.reduction", LogComponent::STATS_REDUCTION},
    {"ingest", LogComponent::INGEST},
    {"report", LogComponent::REPORT}};

AppConfig::AppConfig() {
  // Everything at WARN, except CORE which reports its lifecycle at INFO
  for (const auto &pair : key_to_component_map) {
    logging.log_levels[pair.second] = LogLevel::WARN;
  }
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

// "tab" and "space" name the whitespace delimiters, which do not survive
// trimming
char string_to_delimiter(const std::string &value, char fallback) {
  std::string lowered = Utils::to_lower_copy(value);
  if (lowered == "tab" || lowered == "\\t")
    return '\t';
  if (lowered == "space")
    return ' ';
  if (value.size() == 1)
    return value[0];
  return fallback;
}

bool validate_reader_config(const ReaderConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.column < -1) {
    errors.push_back("Reader column must be -1 (whole line) or a zero-based "
                     "column index");
    valid = false;
  }

  if (config.batch_size < 1 || config.batch_size > 1000000) {
    errors.push_back("Reader batch size must be between 1 and 1000000");
    valid = false;
  }

  if (config.column >= 0 &&
      (config.delimiter == '#' || config.delimiter == '\n')) {
    errors.push_back("Reader delimiter cannot be '#' or a newline");
    valid = false;
  }

  return valid;
}

bool validate_ingest_config(const IngestConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_count < 1 || config.worker_count > 256) {
    errors.push_back("Ingest worker count must be between 1 and 256");
    valid = false;
  }

  if (config.queue_capacity_batches < 1 ||
      config.queue_capacity_batches > 65536) {
    errors.push_back(
        "Ingest queue capacity must be between 1 and 65536 batches");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.input_path.empty()) {
    errors.push_back("Input path cannot be empty (use '-' for stdin)");
    valid = false;
  }

  if (config.stream_name.empty()) {
    errors.push_back("Stream name cannot be empty");
    valid = false;
  }

  if (config.output_format != "text" && config.output_format != "json" &&
      config.output_format != "prometheus") {
    errors.push_back("Output format must be one of: text, json, prometheus");
    valid = false;
  }

  if (config.ddof > 1) {
    errors.push_back("ddof must be 0 (population) or 1 (sample)");
    valid = false;
  }

  if (!validate_reader_config(config.reader, errors))
    valid = false;

  if (!validate_ingest_config(config.ingest, errors))
    valid = false;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Attempting to load configuration from " << filepath);
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    if (current_section.empty()) {
      if (key == Keys::INPUT_PATH)
        config.input_path = value;
      else if (key == Keys::STREAM_NAME)
        config.stream_name = value;
      else if (key == Keys::OUTPUT_FORMAT)
        config.output_format = Utils::to_lower_copy(value);
      else if (key == Keys::DDOF)
        config.ddof = Utils::string_to_number<uint32_t>(value).value_or(
            config.ddof);
      else if (key == Keys::COMPARE_REFERENCE)
        config.compare_reference = string_to_bool(value);
      else
        config.custom_settings[key] = value;

    } else if (current_section == "Reader") {
      if (key == Keys::RD_COLUMN)
        config.reader.column = Utils::string_to_number<int>(value).value_or(
            config.reader.column);
      else if (key == Keys::RD_DELIMITER)
        config.reader.delimiter =
            string_to_delimiter(value, config.reader.delimiter);
      else if (key == Keys::RD_SKIP_HEADER)
        config.reader.skip_header = string_to_bool(value);
      else if (key == Keys::RD_STRICT)
        config.reader.strict = string_to_bool(value);
      else if (key == Keys::RD_BATCH_SIZE)
        config.reader.batch_size =
            Utils::string_to_number<size_t>(value).value_or(
                config.reader.batch_size);
      else
        config.custom_settings["Reader." + key] = value;

    } else if (current_section == "Ingest") {
      if (key == Keys::IN_WORKER_COUNT)
        config.ingest.worker_count =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.ingest.worker_count);
      else if (key == Keys::IN_QUEUE_CAPACITY_BATCHES)
        config.ingest.queue_capacity_batches =
            Utils::string_to_number<size_t>(value).value_or(
                config.ingest.queue_capacity_batches);
      else
        config.custom_settings["Ingest." + key] = value;

    } else if (current_section == "Logging") {
      auto level = string_to_log_level(value);
      if (!level) {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown log level '" << value << "' for '" << key
                  << "', keeping the current level" << std::endl;
        continue;
      }
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        for (auto &pair : config.logging.log_levels)
          pair.second = *level;
      } else {
        auto it = key_to_component_map.find(key);
        if (it != key_to_component_map.end())
          config.logging.log_levels[it->second] = *level;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
      }

    } else {
      config.custom_settings[current_section + "." + key] = value;
    }
  }

  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration parsed from " << filepath << " (" << line_num
                                   << " lines)");
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
