#include "preprocessor.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include <aws/core/utils/logging/LogMacros.h>

#include "errors.hpp"
#include "execution/execution_adapter.hpp"
#include "utils/assert.hpp"

namespace seqpart {

namespace {

void LogProgress(int verbosity, const std::string& message) {
  if (verbosity > 0) {
    AWS_LOGSTREAM_INFO(kPreprocessorTag.c_str(), message);
  } else {
    AWS_LOGSTREAM_DEBUG(kPreprocessorTag.c_str(), message);
  }
}

}  // namespace

size_t PreprocessConfig::EffectiveChunkSize(uint64_t object_size) const {
  if (chunk_size.has_value()) {
    if (*chunk_size == 0) {
      throw InvalidArgumentError("The preprocessing chunk size must be positive.");
    }
    return *chunk_size;
  }

  return static_cast<size_t>((object_size + kDefaultScanRangeCount - 1) / kDefaultScanRangeCount);
}

Preprocessor::Preprocessor(std::shared_ptr<AbstractExecutor> executor) : executor_(std::move(executor)) {
  Assert(executor_ != nullptr, "The preprocessor needs an executor.");
}

std::vector<ByteRange> Preprocessor::SplitIntoScanRanges(uint64_t object_size, size_t chunk_size) {
  Assert(chunk_size > 0, "Chunk size must be positive.");

  std::vector<ByteRange> ranges;
  ranges.reserve((object_size + chunk_size - 1) / chunk_size);
  for (ByteOffset first_byte = 0; first_byte < object_size; first_byte += chunk_size) {
    ranges.push_back({first_byte, std::min<ByteOffset>(first_byte + chunk_size, object_size)});
  }
  return ranges;
}

ObjectIndex Preprocessor::MergeScanResults(uint64_t object_size, char record_sentinel,
                                           const std::vector<RangeScanResult>& results) {
  ObjectIndex index;
  index.total_size_bytes = object_size;
  index.format_version = kIndexFormatVersion;
  index.record_sentinel = record_sentinel;
  index.scan_ranges.reserve(results.size());

  ByteOffset expected_first_byte = 0;
  for (const auto& result : results) {
    Assert(result.summary.range.first_byte == expected_first_byte, "Scan results must be contiguous and ordered.");
    expected_first_byte = result.summary.range.end_byte;

    ScanRangeSummary summary = result.summary;
    // Leading bytes before the first header of the object are preamble, not a continuation.
    summary.continues_previous_record = summary.continues_previous_record && !index.entries.empty();
    index.scan_ranges.push_back(summary);

    for (const auto& header : result.headers) {
      if (!index.entries.empty()) {
        IndexEntry& previous = index.entries.back();
        DebugAssert(header.offset > previous.offset, "Record headers must be strictly increasing.");
        previous.length_bytes = header.offset - previous.offset;
      }
      index.entries.push_back({header.offset, header.identifier, 0});
    }
  }
  Assert(expected_first_byte == object_size, "Scan results must cover the entire object.");

  if (index.entries.empty()) {
    throw FormatError(std::string("No record header starting with '") + record_sentinel + "' found.");
  }

  index.entries.back().length_bytes = object_size - index.entries.back().offset;
  index.record_count = index.entries.size();
  Assert(index.IsConsistent(), "Merged index violates its coverage invariants.");
  return index;
}

ObjectIndex Preprocessor::Preprocess(const std::shared_ptr<const ObjectHandle>& handle,
                                     const PreprocessConfig& config) const {
  Assert(handle != nullptr, "Cannot preprocess without an object handle.");

  const uint64_t object_size = handle->Size();
  const size_t chunk_size = config.EffectiveChunkSize(object_size);
  if (object_size == 0) {
    throw FormatError("Object " + handle->Locator().ToUri() + " is empty.");
  }

  const std::vector<ByteRange> ranges = SplitIntoScanRanges(object_size, chunk_size);
  {
    std::stringstream message;
    message << "Scanning " << handle->Locator() << " (" << object_size << " bytes) in " << ranges.size()
            << " ranges of up to " << chunk_size << " bytes.";
    LogProgress(config.verbosity, message.str());
  }

  const char record_sentinel = config.record_sentinel;
  const std::vector<RangeScanResult> results = MapUnits(
      *executor_, ranges,
      [&handle, record_sentinel](const ByteRange& range) { return ScanRange(*handle, range, record_sentinel); },
      config.parallelism_hint);

  ObjectIndex index = MergeScanResults(object_size, record_sentinel, results);

  std::stringstream message;
  message << "Indexed " << index.record_count << " records of " << handle->Locator() << ".";
  LogProgress(config.verbosity, message.str());
  return index;
}

}  // namespace seqpart
