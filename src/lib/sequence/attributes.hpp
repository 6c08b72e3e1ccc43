#pragma once

#include <cstdint>
#include <memory>

#include "object_index.hpp"

namespace seqpart {

/**
 * Read-only view of the metadata of a preprocessed object.
 */
class Attributes {
 public:
  explicit Attributes(std::shared_ptr<const ObjectIndex> index);

  size_t NumSequences() const { return index_->record_count; }
  uint64_t TotalSizeBytes() const { return index_->total_size_bytes; }
  int64_t FormatVersion() const { return index_->format_version; }
  double MeanRecordLengthBytes() const;

 private:
  std::shared_ptr<const ObjectIndex> index_;
};

}  // namespace seqpart
