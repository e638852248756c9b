#include "file_value_reader.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <string>

FileValueReader::FileValueReader(const std::string &filepath,
                                 const Config::ReaderConfig &options)
    : filepath_(filepath), file_stream_(filepath),
      reader_(file_stream_, options) {
  if (!is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Failed to open value source file: " << filepath);
    throw std::runtime_error("Failed to open value source file: " + filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened value file: " << filepath);
}

FileValueReader::~FileValueReader() {
  if (file_stream_.is_open())
    file_stream_.close();
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "FileValueReader closed " << filepath_
                                << ". Total lines read: " << reader_.lines_read());
}

bool FileValueReader::is_open() const { return file_stream_.is_open(); }

bool FileValueReader::exhausted() const { return reader_.exhausted(); }

ValueBatch FileValueReader::get_next_batch() {
  return reader_.get_next_batch();
}
