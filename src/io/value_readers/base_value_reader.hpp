#ifndef BASE_VALUE_READER_HPP
#define BASE_VALUE_READER_HPP

#include <cstdint>
#include <vector>

struct ValueBatch {
  std::vector<double> values;
  // Lines in this batch that did not yield a finite number
  uint64_t rejected = 0;

  bool empty() const { return values.empty() && rejected == 0; }
};

class IValueReader {
public:
  virtual ~IValueReader() = default;

  // Fetches the next batch of observations. The batch size is
  // implementation-specific. An empty batch means no further input right now.
  virtual ValueBatch get_next_batch() = 0;

  // True once the underlying source has reached its end
  virtual bool exhausted() const = 0;
};

#endif // BASE_VALUE_READER_HPP
