#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

#include "types.hpp"

namespace seqpart {

/**
 * One record of a sequence file. The record spans from its header sentinel up to the next record's sentinel or the end
 * of the object, line breaks included.
 */
struct IndexEntry {
  ByteOffset offset = 0;
  std::string identifier;
  uint64_t length_bytes = 0;

  ByteOffset EndOffset() const { return offset + length_bytes; }

  Aws::Utils::Json::JsonValue ToJson() const;
  static IndexEntry FromJson(const Aws::Utils::Json::JsonView& json);

  bool operator==(const IndexEntry& other) const = default;
};

/**
 * What a single scan task observed in its byte range.
 */
struct ScanRangeSummary {
  ByteRange range;
  size_t num_record_headers = 0;
  // The range starts inside a record whose header lies in an earlier range.
  bool continues_previous_record = false;

  Aws::Utils::Json::JsonValue ToJson() const;
  static ScanRangeSummary FromJson(const Aws::Utils::Json::JsonView& json);

  bool operator==(const ScanRangeSummary& other) const = default;
};

/**
 * The result of preprocessing an object. Entries are sorted by offset, do not overlap and tile the object from the
 * first record header to its end; bytes before the first header are a preamble.
 */
struct ObjectIndex {
  std::vector<IndexEntry> entries;
  size_t record_count = 0;
  uint64_t total_size_bytes = 0;
  int64_t format_version = 0;
  char record_sentinel = '>';
  std::vector<ScanRangeSummary> scan_ranges;

  /**
   * Number of bytes before the first record header.
   */
  uint64_t PreambleSizeBytes() const;

  /**
   * Checks the ordering and coverage invariants. Used to reject corrupt persisted indexes.
   */
  bool IsConsistent() const;

  /**
   * Returns the entries whose record start lies inside @param range.
   */
  std::vector<IndexEntry> EntriesStartingIn(const ByteRange& range) const;

  /**
   * Offset of the first record start at or after @param offset, or total_size_bytes if there is none.
   */
  ByteOffset NextRecordStart(ByteOffset offset) const;

  Aws::Utils::Json::JsonValue ToJson() const;

  /**
   * Throws a FormatError if the document is incomplete or the resulting index is inconsistent.
   */
  static ObjectIndex FromJson(const Aws::Utils::Json::JsonView& json);

  bool operator==(const ObjectIndex& other) const = default;
};

}  // namespace seqpart
