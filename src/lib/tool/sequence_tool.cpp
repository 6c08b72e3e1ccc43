#include "sequence_tool.hpp"

#include <iostream>
#include <mutex>
#include <numeric>
#include <vector>

#include <aws/core/utils/logging/LogMacros.h>

#include "client/base_client.hpp"
#include "constants.hpp"
#include "execution/local_executor.hpp"
#include "sequence/errors.hpp"
#include "sequence/index_store.hpp"
#include "sequence/object_handle.hpp"
#include "sequence/sequence_data_source.hpp"
#include "storage/backend/filesystem_storage.hpp"
#include "storage/backend/s3_storage.hpp"
#include "utils/assert.hpp"

namespace seqpart {

namespace {

// Index locations name a directory or a bucket, so unlike object URIs they do not need a key.
ObjectLocator ContainerFromUri(const std::string& uri) {
  if (uri.starts_with(kS3UriScheme)) {
    const std::string path = uri.substr(kS3UriScheme.size());
    AssertInput(!path.empty(), "Index URI needs a bucket.");
    return {StorageBackend::kS3, path.substr(0, path.find('/')), ""};
  }
  if (uri.starts_with(kFilesystemUriScheme)) {
    const std::string path = uri.substr(kFilesystemUriScheme.size());
    AssertInput(!path.empty(), "Index URI needs a directory.");
    return {StorageBackend::kFilesystem, path, ""};
  }
  FailInput("Unsupported index URI '" + uri + "'.");
}

struct ToolContext {
  std::shared_ptr<const ObjectHandle> handle;
  std::shared_ptr<SequenceDataSource> data_source;
};

ToolContext OpenDataSource(const cxxopts::ParseResult& parse_result) {
  AssertInput(parse_result.count(kObjectUriOption) > 0, "Option --uri is required.");
  const ObjectLocator locator = ObjectLocator::FromUri(parse_result[kObjectUriOption].as<std::string>());
  const ObjectLocator index_locator = parse_result.count(kIndexUriOption) > 0
                                          ? ContainerFromUri(parse_result[kIndexUriOption].as<std::string>())
                                          : ObjectLocator{locator.backend, locator.container, ""};

  const StorageResolver resolver = CreateStorageResolver();
  auto handle = ObjectHandle::Resolve(resolver(locator), locator);
  auto index_store = std::make_shared<IndexStore>(resolver(index_locator));
  auto executor = parse_result.count(kThreadsOption) > 0
                      ? std::make_shared<LocalExecutor>(parse_result[kThreadsOption].as<size_t>())
                      : std::make_shared<LocalExecutor>();

  auto data_source = std::make_shared<SequenceDataSource>(handle, std::move(executor), std::move(index_store));
  return {std::move(handle), std::move(data_source)};
}

}  // namespace

StorageResolver CreateStorageResolver() {
  struct S3Connection {
    std::once_flag once;
    std::shared_ptr<BaseClient> client;
  };
  auto connection = std::make_shared<S3Connection>();

  return [connection](const ObjectLocator& locator) -> std::shared_ptr<Storage> {
    switch (locator.backend) {
      case StorageBackend::kFilesystem:
        return std::make_shared<FilesystemStorage>(locator.container);
      case StorageBackend::kS3:
        std::call_once(connection->once, [&connection]() { connection->client = std::make_shared<BaseClient>(); });
        return std::make_shared<S3Storage>(connection->client->GetS3Client(), locator.container);
    }
    Fail("Unexpected storage backend.");
  };
}

PreprocessConfig PreprocessConfigFromOptions(const cxxopts::ParseResult& parse_result) {
  PreprocessConfig config;
  if (parse_result.count(kChunkSizeOption) > 0) {
    config.chunk_size = parse_result[kChunkSizeOption].as<size_t>();
  }
  config.parallelism_hint = parse_result[kParallelismOption].as<size_t>();
  config.verbosity = parse_result[kVerbosityOption].as<int>();

  const std::string sentinel = parse_result[kSentinelOption].as<std::string>();
  AssertInput(sentinel.size() == 1, "The record sentinel must be a single character.");
  config.record_sentinel = sentinel.front();
  return config;
}

PartitionParameters PartitionParametersFromOptions(const cxxopts::ParseResult& parse_result) {
  if (parse_result.count(kPartitionSizeOption) > 0) {
    return PartitionParameters::WithChunkSize(parse_result[kPartitionSizeOption].as<uint64_t>());
  }
  AssertInput(parse_result.count(kNumChunksOption) > 0, "Either --num_chunks or --partition_size is required.");
  return PartitionParameters::WithChunkCount(parse_result[kNumChunksOption].as<int64_t>());
}

size_t CountPseudoRecords(const std::string& fragment, char record_sentinel) {
  if (fragment.empty()) {
    return 0;
  }

  // The first line is either a header or the continuation of a record from an earlier fragment. Both count once.
  size_t count = 1;
  for (size_t i = 1; i < fragment.size(); ++i) {
    if (fragment[i] == record_sentinel && fragment[i - 1] == '\n') {
      ++count;
    }
  }
  return count;
}

void PreprocessObjectTool(const cxxopts::ParseResult& parse_result) {
  const PreprocessConfig config = PreprocessConfigFromOptions(parse_result);
  const ToolContext context = OpenDataSource(parse_result);

  context.data_source->Preprocess(config);
  const Attributes attributes = context.data_source->GetAttributes();

  std::cout << context.handle->Locator() << "\n"
            << "  num_sequences:  " << attributes.NumSequences() << "\n"
            << "  total_size:     " << attributes.TotalSizeBytes() << "\n"
            << "  mean_length:    " << attributes.MeanRecordLengthBytes() << "\n"
            << "  format_version: " << attributes.FormatVersion() << std::endl;
}

void PartitionObjectTool(const cxxopts::ParseResult& parse_result) {
  const PartitionParameters parameters = PartitionParametersFromOptions(parse_result);
  const PartitionStrategyType strategy = PartitionStrategyTypeFromName(parse_result[kStrategyOption].as<std::string>());
  const ToolContext context = OpenDataSource(parse_result);

  const std::vector<PartitionSlice> slices = context.data_source->Partition(strategy, parameters);
  AWS_LOGSTREAM_INFO(kToolTag.c_str(), "Partitioned " << context.handle->Locator() << " into " << slices.size()
                                                      << " slices.");

  if (!parse_result[kCountRecordsOption].as<bool>()) {
    for (const auto& slice : slices) {
      std::cout << slice.Serialize() << "\n";
    }
    std::cout << std::flush;
    return;
  }

  const std::string sentinel = parse_result[kSentinelOption].as<std::string>();
  AssertInput(sentinel.size() == 1, "The record sentinel must be a single character.");
  const char record_sentinel = sentinel.front();

  const std::vector<size_t> counts = context.data_source->MapSlices(
      slices, [record_sentinel](const PartitionSlice& slice) { return CountPseudoRecords(slice.Get(), record_sentinel); });

  for (size_t i = 0; i < slices.size(); ++i) {
    std::cout << "slice " << i << " " << slices[i].Range() << ": " << counts[i] << " records\n";
  }
  std::cout << "total: " << std::accumulate(counts.cbegin(), counts.cend(), size_t{0}) << " records" << std::endl;
}

}  // namespace seqpart
