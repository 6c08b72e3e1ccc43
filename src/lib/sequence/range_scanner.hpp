#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "object_handle.hpp"
#include "object_index.hpp"
#include "types.hpp"

namespace seqpart {

struct RecordHeaderObservation {
  ByteOffset offset = 0;
  std::string identifier;

  bool operator==(const RecordHeaderObservation& other) const = default;
};

/**
 * Local observations of one scan task. Headers are attributed to the range that contains their sentinel, so every
 * header of the object is reported by exactly one range.
 */
struct RangeScanResult {
  ScanRangeSummary summary;
  std::vector<RecordHeaderObservation> headers;
};

/**
 * Scans @param range of the object for lines that start with @param record_sentinel. Reads one byte before the range to
 * tell whether the range starts at a line start, and reads ahead past the range end if the last header line is not
 * terminated inside the range. Stateless and safe to run concurrently for different ranges.
 */
RangeScanResult ScanRange(const ObjectHandle& handle, const ByteRange& range, char record_sentinel);

/**
 * Extracts the record identifier from a header line: the text after the sentinel up to the first whitespace.
 */
std::string ParseRecordIdentifier(std::string_view header_line);

}  // namespace seqpart
