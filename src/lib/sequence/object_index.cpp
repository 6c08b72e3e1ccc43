#include "object_index.hpp"

#include <algorithm>

#include "constants.hpp"
#include "errors.hpp"
#include "utils/json.hpp"

namespace seqpart {

namespace {

const std::string kEntryOffsetAttribute = "offset";
const std::string kEntryIdentifierAttribute = "identifier";
const std::string kEntryLengthAttribute = "length_bytes";
const std::string kSummaryRangeAttribute = "range";
const std::string kSummaryHeadersAttribute = "num_record_headers";
const std::string kSummaryContinuesAttribute = "continues_previous_record";

void RequireAttributes(const Aws::Utils::Json::JsonView& json, const std::vector<std::string>& attributes,
                       const std::string& document_name) {
  for (const auto& attribute : attributes) {
    if (!json.ValueExists(attribute)) {
      throw FormatError(document_name + " lacks attribute '" + attribute + "'.");
    }
  }
}

}  // namespace

Aws::Utils::Json::JsonValue IndexEntry::ToJson() const {
  return Aws::Utils::Json::JsonValue()
      .WithInt64(kEntryOffsetAttribute, static_cast<int64_t>(offset))
      .WithString(kEntryIdentifierAttribute, identifier)
      .WithInt64(kEntryLengthAttribute, static_cast<int64_t>(length_bytes));
}

IndexEntry IndexEntry::FromJson(const Aws::Utils::Json::JsonView& json) {
  RequireAttributes(json, {kEntryOffsetAttribute, kEntryIdentifierAttribute, kEntryLengthAttribute}, "Index entry");
  return {static_cast<ByteOffset>(json.GetInt64(kEntryOffsetAttribute)), json.GetString(kEntryIdentifierAttribute),
          static_cast<uint64_t>(json.GetInt64(kEntryLengthAttribute))};
}

Aws::Utils::Json::JsonValue ScanRangeSummary::ToJson() const {
  return Aws::Utils::Json::JsonValue()
      .WithObject(kSummaryRangeAttribute, range.ToJson())
      .WithInt64(kSummaryHeadersAttribute, static_cast<int64_t>(num_record_headers))
      .WithBool(kSummaryContinuesAttribute, continues_previous_record);
}

ScanRangeSummary ScanRangeSummary::FromJson(const Aws::Utils::Json::JsonView& json) {
  RequireAttributes(json, {kSummaryRangeAttribute, kSummaryHeadersAttribute, kSummaryContinuesAttribute},
                    "Scan range summary");
  return {ByteRange::FromJson(json.GetObject(kSummaryRangeAttribute)),
          static_cast<size_t>(json.GetInt64(kSummaryHeadersAttribute)), json.GetBool(kSummaryContinuesAttribute)};
}

uint64_t ObjectIndex::PreambleSizeBytes() const { return entries.empty() ? total_size_bytes : entries.front().offset; }

bool ObjectIndex::IsConsistent() const {
  if (entries.size() != record_count) {
    return false;
  }

  ByteOffset expected_offset = PreambleSizeBytes();
  for (const auto& entry : entries) {
    if (entry.offset != expected_offset || entry.length_bytes == 0) {
      return false;
    }
    expected_offset = entry.EndOffset();
  }

  return expected_offset == total_size_bytes;
}

std::vector<IndexEntry> ObjectIndex::EntriesStartingIn(const ByteRange& range) const {
  const auto by_offset = [](const IndexEntry& entry) { return entry.offset; };
  const auto first = std::ranges::lower_bound(entries, range.first_byte, {}, by_offset);
  const auto last = std::ranges::lower_bound(entries, range.end_byte, {}, by_offset);
  return {first, last};
}

ByteOffset ObjectIndex::NextRecordStart(ByteOffset offset) const {
  const auto entry = std::ranges::lower_bound(entries, offset, {}, [](const IndexEntry& e) { return e.offset; });
  return entry == entries.cend() ? total_size_bytes : entry->offset;
}

Aws::Utils::Json::JsonValue ObjectIndex::ToJson() const {
  return Aws::Utils::Json::JsonValue()
      .WithArray(kIndexEntriesAttribute, VectorToJsonArray(entries))
      .WithInt64(kIndexRecordCountAttribute, static_cast<int64_t>(record_count))
      .WithInt64(kIndexTotalSizeAttribute, static_cast<int64_t>(total_size_bytes))
      .WithInt64(kIndexFormatVersionAttribute, format_version)
      .WithString(kIndexSentinelAttribute, std::string(1, record_sentinel))
      .WithArray(kIndexScanRangesAttribute, VectorToJsonArray(scan_ranges));
}

ObjectIndex ObjectIndex::FromJson(const Aws::Utils::Json::JsonView& json) {
  RequireAttributes(json,
                    {kIndexEntriesAttribute, kIndexRecordCountAttribute, kIndexTotalSizeAttribute,
                     kIndexFormatVersionAttribute, kIndexSentinelAttribute, kIndexScanRangesAttribute},
                    "Object index");

  const std::string sentinel = json.GetString(kIndexSentinelAttribute);
  if (sentinel.size() != 1) {
    throw FormatError("Object index has an invalid record sentinel.");
  }

  ObjectIndex index;
  index.entries = JsonArrayToVector<IndexEntry>(json.GetArray(kIndexEntriesAttribute));
  index.record_count = static_cast<size_t>(json.GetInt64(kIndexRecordCountAttribute));
  index.total_size_bytes = static_cast<uint64_t>(json.GetInt64(kIndexTotalSizeAttribute));
  index.format_version = json.GetInt64(kIndexFormatVersionAttribute);
  index.record_sentinel = sentinel.front();
  index.scan_ranges = JsonArrayToVector<ScanRangeSummary>(json.GetArray(kIndexScanRangesAttribute));

  if (!index.IsConsistent()) {
    throw FormatError("Object index violates its ordering or coverage invariants.");
  }
  return index;
}

}  // namespace seqpart
