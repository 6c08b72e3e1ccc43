#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "utils/literal.hpp"

namespace seqpart {

const std::string kConstPrefix = "k";

/**
 * Logging tags passed to the AWS SDK log macros.
 */
const std::string kBaseTag = "Seqpart";
const std::string kPreprocessorTag = "SeqpartPreprocessor";
const std::string kPartitionerTag = "SeqpartPartitioner";
const std::string kIndexStoreTag = "SeqpartIndexStore";
const std::string kToolTag = "SeqpartTool";

/**
 * Version of the ObjectIndex layout. It is part of every index fingerprint, so bumping it invalidates all persisted
 * index artifacts.
 */
inline constexpr int64_t kIndexFormatVersion = 1;

/**
 * Suffix of persisted index artifacts: <object key>.<fingerprint><suffix>
 */
inline constexpr std::string_view kIndexObjectSuffix = ".seqidx";

/**
 * First character of a record header line in FASTA-like files.
 */
inline constexpr char kDefaultRecordSentinel = '>';

/**
 * Without an explicit chunk size, preprocessing splits an object into this many scan ranges.
 */
inline constexpr size_t kDefaultScanRangeCount = 4;

/**
 * A scan task whose last header line is not terminated inside its range reads ahead in steps of this size until it
 * finds the line break or the end of the object.
 */
inline constexpr size_t kHeaderLookaheadBytes = 4_KB;

/**
 * URI schemes of object locators.
 */
inline constexpr std::string_view kS3UriScheme = "s3://";
inline constexpr std::string_view kFilesystemUriScheme = "file://";

/**
 * JSON attribute names of serialized locators, slices and index artifacts.
 */
inline const std::string kLocatorBackendAttribute = "backend";
inline const std::string kLocatorContainerAttribute = "container";
inline const std::string kLocatorKeyAttribute = "key";
inline const std::string kHandleSizeAttribute = "size_bytes";
inline const std::string kHandleChecksumAttribute = "checksum";
inline const std::string kSliceOrdinalAttribute = "ordinal";
inline const std::string kSliceRangeAttribute = "range";
inline const std::string kSliceEntriesAttribute = "entries";
inline const std::string kIndexEntriesAttribute = "entries";
inline const std::string kIndexRecordCountAttribute = "record_count";
inline const std::string kIndexTotalSizeAttribute = "total_size_bytes";
inline const std::string kIndexFormatVersionAttribute = "format_version";
inline const std::string kIndexSentinelAttribute = "record_sentinel";
inline const std::string kIndexScanRangesAttribute = "scan_ranges";
inline const std::string kIndexObjectAttribute = "object";

}  // namespace seqpart
