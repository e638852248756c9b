#ifndef STREAM_VALUE_READER_HPP
#define STREAM_VALUE_READER_HPP

#include "base_value_reader.hpp"
#include "core/config.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string_view>

// Reads one observation per text line from any std::istream. The stream
// must outlive the reader.
class StreamValueReader : public IValueReader {
public:
  StreamValueReader(std::istream &input, const Config::ReaderConfig &options);

  ValueBatch get_next_batch() override;
  bool exhausted() const override;

  uint64_t lines_read() const { return line_number_; }

  /**
   * Extracts the configured field from one line and parses it
   * @return nullopt if the field is missing, unparsable or not finite
   */
  std::optional<double> parse_line(std::string_view line) const;

private:
  std::istream &input_;
  Config::ReaderConfig options_;
  uint64_t line_number_ = 0;
  bool header_pending_;
};

#endif // STREAM_VALUE_READER_HPP
