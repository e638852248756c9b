#include "stream_value_reader.hpp"
#include "core/logger.hpp"
#include "core/stats_errors.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <string>
#include <vector>

StreamValueReader::StreamValueReader(std::istream &input,
                                     const Config::ReaderConfig &options)
    : input_(input), options_(options), header_pending_(options.skip_header) {
  if (options_.batch_size == 0)
    options_.batch_size = 1;
}

bool StreamValueReader::exhausted() const { return !input_.good(); }

std::optional<double>
StreamValueReader::parse_line(std::string_view line) const {
  std::string_view field = line;
  if (options_.column >= 0) {
    auto columns = Utils::split_string_view(line, options_.delimiter);
    if (static_cast<size_t>(options_.column) >= columns.size())
      return std::nullopt;
    field = columns[options_.column];
  }

  auto value = Utils::string_to_number<double>(Utils::trim_view(field));
  if (!value || !std::isfinite(*value))
    return std::nullopt;
  return value;
}

ValueBatch StreamValueReader::get_next_batch() {
  ValueBatch batch;
  batch.values.reserve(options_.batch_size);
  std::string line;

  while (batch.values.size() + batch.rejected < options_.batch_size &&
         std::getline(input_, line)) {
    line_number_++;
    std::string_view trimmed = Utils::trim_view(line);
    if (trimmed.empty() || trimmed.front() == '#')
      continue;

    if (header_pending_) {
      header_pending_ = false;
      LOG(LogLevel::DEBUG, LogComponent::IO_READER,
          "Skipping header line " << line_number_ << ": " << trimmed);
      continue;
    }

    if (auto value = parse_line(trimmed)) {
      batch.values.push_back(*value);
      continue;
    }

    if (options_.strict) {
      LOG(LogLevel::ERROR, LogComponent::IO_READER,
          "Rejecting line " << line_number_ << " in strict mode: " << trimmed);
      throw stats::InvalidInputError("Line " + std::to_string(line_number_) +
                                     " is not a finite number: '" +
                                     std::string(trimmed) + "'");
    }

    batch.rejected++;
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "Skipping line " << line_number_
                         << ", not a finite number: " << trimmed);
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read " << batch.values.size() << " values (" << batch.rejected
              << " rejected) up to line " << line_number_);
  return batch;
}
