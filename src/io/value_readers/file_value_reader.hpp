#ifndef FILE_VALUE_READER_HPP
#define FILE_VALUE_READER_HPP

#include "base_value_reader.hpp"
#include "stream_value_reader.hpp"

#include <fstream>
#include <string>

// An implementation of IValueReader that reads observations from a text file
class FileValueReader : public IValueReader {
public:
  // Throws std::runtime_error if the file cannot be opened
  FileValueReader(const std::string &filepath,
                  const Config::ReaderConfig &options);
  ~FileValueReader() override;

  ValueBatch get_next_batch() override;
  bool exhausted() const override;
  bool is_open() const;

private:
  std::string filepath_;
  std::ifstream file_stream_;
  StreamValueReader reader_;
};

#endif // FILE_VALUE_READER_HPP
