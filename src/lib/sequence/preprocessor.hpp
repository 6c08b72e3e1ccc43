#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "constants.hpp"
#include "execution/abstract_executor.hpp"
#include "object_handle.hpp"
#include "object_index.hpp"
#include "range_scanner.hpp"

namespace seqpart {

struct PreprocessConfig {
  // Bytes per scan range. Defaults to a quarter of the object, rounded up.
  std::optional<size_t> chunk_size;
  // Maximum number of scan ranges handed to the executor at once; 0 submits all of them.
  size_t parallelism_hint = 0;
  // 0 logs progress at debug level, anything higher at info level.
  int verbosity = 0;
  char record_sentinel = kDefaultRecordSentinel;

  /**
   * Throws an InvalidArgumentError if an explicit chunk size is zero.
   */
  size_t EffectiveChunkSize(uint64_t object_size) const;
};

/**
 * Builds the ObjectIndex of an object in two phases. First, independent scan tasks, one per chunk, run on the executor
 * and report the record headers in their range. Second, the calling thread folds the per-range results in range order
 * into record entries. Records whose header and body lie in different ranges are stitched by that fold: a record
 * belongs to the range holding its header and extends to the next header in any later range.
 */
class Preprocessor {
 public:
  explicit Preprocessor(std::shared_ptr<AbstractExecutor> executor);

  /**
   * Throws a FormatError if the object is empty or contains no record header, and an IOError if any range cannot be
   * read. Does not retry; one failed range fails the whole call.
   */
  ObjectIndex Preprocess(const std::shared_ptr<const ObjectHandle>& handle, const PreprocessConfig& config) const;

  /**
   * Splits [0, object_size) into ceil(object_size / chunk_size) contiguous ranges.
   */
  static std::vector<ByteRange> SplitIntoScanRanges(uint64_t object_size, size_t chunk_size);

  static ObjectIndex MergeScanResults(uint64_t object_size, char record_sentinel,
                                      const std::vector<RangeScanResult>& results);

 private:
  std::shared_ptr<AbstractExecutor> executor_;
};

}  // namespace seqpart
