#include "attributes.hpp"

#include <utility>

#include "utils/assert.hpp"

namespace seqpart {

Attributes::Attributes(std::shared_ptr<const ObjectIndex> index) : index_(std::move(index)) {
  Assert(index_ != nullptr, "Attributes need an index.");
}

double Attributes::MeanRecordLengthBytes() const {
  if (index_->record_count == 0) {
    return 0.0;
  }
  const uint64_t record_bytes = index_->total_size_bytes - index_->PreambleSizeBytes();
  return static_cast<double>(record_bytes) / static_cast<double>(index_->record_count);
}

}  // namespace seqpart
