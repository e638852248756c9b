#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *INPUT_PATH = "input_path";
constexpr const char *STREAM_NAME = "stream_name";
constexpr const char *OUTPUT_FORMAT = "output_format";
constexpr const char *DDOF = "ddof";
constexpr const char *COMPARE_REFERENCE = "compare_reference";

// Reader Settings
constexpr const char *RD_COLUMN = "column";
constexpr const char *RD_DELIMITER = "delimiter";
constexpr const char *RD_SKIP_HEADER = "skip_header";
constexpr const char *RD_STRICT = "strict";
constexpr const char *RD_BATCH_SIZE = "batch_size";

// Ingest Settings
constexpr const char *IN_WORKER_COUNT = "worker_count";
constexpr const char *IN_QUEUE_CAPACITY_BATCHES = "queue_capacity_batches";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ReaderConfig {
  // -1 reads the whole line as the value
  int column = -1;
  char delimiter = ',';
  bool skip_header = false;
  bool strict = false;
  size_t batch_size = 1000;
};

struct IngestConfig {
  uint32_t worker_count = 1;
  size_t queue_capacity_batches = 64;
};

struct AppConfig {
  // "-" reads standard input
  std::string input_path = "-";
  std::string stream_name = "default";
  std::string output_format = "text";
  uint32_t ddof = 0;
  bool compare_reference = false;

  ReaderConfig reader;
  IngestConfig ingest;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

// nullopt for names other than TRACE..FATAL (case-insensitive)
std::optional<LogLevel> string_to_log_level(const std::string &level_str_raw);

bool validate_reader_config(const ReaderConfig &config,
                            std::vector<std::string> &errors);
bool validate_ingest_config(const IngestConfig &config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
