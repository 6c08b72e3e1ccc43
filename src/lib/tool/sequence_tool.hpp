#pragma once

#include <memory>
#include <string>

#include <cxxopts.hpp>

#include "sequence/object_locator.hpp"
#include "sequence/partition_strategy.hpp"
#include "sequence/preprocessor.hpp"

namespace seqpart {

static constexpr auto kObjectUriOption = "uri";
static constexpr auto kObjectUriHint = "Object to process, e.g., s3://bucket/genome.fa or file:///data/genome.fa";

static constexpr auto kIndexUriOption = "index_uri";
static constexpr auto kIndexUriHint =
    "Directory or bucket for index artifacts, e.g., s3://bucket/indexes (defaults to the object's container)";

static constexpr auto kChunkSizeOption = "chunk_size";
static constexpr auto kChunkSizeHint = "Bytes per parallel scan range (defaults to a quarter of the object)";

static constexpr auto kParallelismOption = "parallelism";
static constexpr auto kParallelismHint = "Maximum number of scan ranges in flight (0 for all)";

static constexpr auto kThreadsOption = "threads";
static constexpr auto kThreadsHint = "Threads of the local executor";

static constexpr auto kSentinelOption = "sentinel";
static constexpr auto kSentinelHint = "First character of record header lines";

static constexpr auto kNumChunksOption = "num_chunks";
static constexpr auto kNumChunksHint = "Number of partitions";

static constexpr auto kPartitionSizeOption = "partition_size";
static constexpr auto kPartitionSizeHint = "Target partition size in bytes (alternative to --num_chunks)";

static constexpr auto kStrategyOption = "strategy";
static constexpr auto kStrategyHint = "Partition strategy, i.e., 'contiguous' or 'record-aligned'";

static constexpr auto kCountRecordsOption = "count_records";
static constexpr auto kCountRecordsHint = "Fetch every slice and count the records it contains";

/**
 * Creates storages for locators, connecting to S3 only when an S3 locator is resolved for the first time.
 */
StorageResolver CreateStorageResolver();

PreprocessConfig PreprocessConfigFromOptions(const cxxopts::ParseResult& parse_result);
PartitionParameters PartitionParametersFromOptions(const cxxopts::ParseResult& parse_result);

/**
 * Counts the lines of @param fragment that start with @param record_sentinel. A non-empty fragment that does not start
 * with a header is the tail of a record and counts as one more pseudo-record.
 */
size_t CountPseudoRecords(const std::string& fragment, char record_sentinel);

/**
 * Builds (or reuses) the index of the object and prints its attributes.
 */
void PreprocessObjectTool(const cxxopts::ParseResult& parse_result);

/**
 * Partitions a preprocessed object and prints one serialized slice per line. With --count_records, every slice is
 * fetched on the local executor and its pseudo-record count is printed instead.
 */
void PartitionObjectTool(const cxxopts::ParseResult& parse_result);

}  // namespace seqpart
