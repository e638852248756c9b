#ifndef RECORDING_VALUE_READER_HPP
#define RECORDING_VALUE_READER_HPP

#include "base_value_reader.hpp"

#include <vector>

// Forwards another reader and keeps a copy of every accepted value, for
// re-scanning the input with the batch reference formulas afterwards.
class RecordingValueReader : public IValueReader {
public:
  explicit RecordingValueReader(IValueReader &inner) : inner_(inner) {}

  ValueBatch get_next_batch() override {
    ValueBatch batch = inner_.get_next_batch();
    recorded_.insert(recorded_.end(), batch.values.begin(), batch.values.end());
    return batch;
  }

  bool exhausted() const override { return inner_.exhausted(); }

  const std::vector<double> &recorded() const { return recorded_; }

private:
  IValueReader &inner_;
  std::vector<double> recorded_;
};

#endif // RECORDING_VALUE_READER_HPP
