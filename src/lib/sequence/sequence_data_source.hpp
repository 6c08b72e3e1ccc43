#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "attributes.hpp"
#include "execution/abstract_executor.hpp"
#include "execution/execution_adapter.hpp"
#include "index_store.hpp"
#include "object_handle.hpp"
#include "object_index.hpp"
#include "partition_slice.hpp"
#include "partition_strategy.hpp"
#include "preprocessor.hpp"

namespace seqpart {

/**
 * Entry point for working with one sequence file: preprocess it once, then partition it as often as needed and map a
 * function over the slices.
 *
 * Usage example:
 *
 * auto storage = std::make_shared<FilesystemStorage>("/data");
 * auto handle = ObjectHandle::Resolve(storage, {StorageBackend::kFilesystem, "/data", "genome.fa"});
 * SequenceDataSource source(handle, std::make_shared<LocalExecutor>());
 * source.Preprocess();
 * auto slices = source.Partition(PartitionStrategyType::kContiguous, PartitionParameters::WithChunkCount(8));
 * auto sizes = source.MapSlices(slices, [](const PartitionSlice& slice) { return slice.Get().size(); });
 */
class SequenceDataSource {
 public:
  /**
   * @param index_store is optional. With a store, Preprocess() reuses and persists indexes, and IsPreprocessed() also
   * finds indexes that an earlier process stored.
   */
  SequenceDataSource(std::shared_ptr<const ObjectHandle> handle, std::shared_ptr<AbstractExecutor> executor,
                     std::shared_ptr<IndexStore> index_store = nullptr);

  /**
   * Builds the index of the object, or loads it from the index store if one was stored for the same object version
   * and configuration. Calling it again with the same configuration yields an identical index.
   */
  std::shared_ptr<const ObjectIndex> Preprocess(const PreprocessConfig& config = {});

  bool IsPreprocessed() const;

  /**
   * Throws an InvalidArgumentError for invalid @param parameters before anything else is checked, and a
   * PreconditionError if the object has not been preprocessed.
   */
  std::vector<PartitionSlice> Partition(const AbstractPartitionStrategy& strategy,
                                        const PartitionParameters& parameters) const;
  std::vector<PartitionSlice> Partition(PartitionStrategyType strategy_type,
                                        const PartitionParameters& parameters) const;

  /**
   * Throws a PreconditionError if the object has not been preprocessed. Never triggers preprocessing.
   */
  Attributes GetAttributes() const;

  /**
   * Applies @param function to every slice on the executor and returns the results in slice order.
   */
  template <typename Function>
  auto MapSlices(const std::vector<PartitionSlice>& slices, const Function& function) const {
    return MapUnits(*executor_, slices, function);
  }

  const std::shared_ptr<const ObjectHandle>& Handle() const { return handle_; }

 private:
  // Returns the index from memory or the index store, or nullptr.
  std::shared_ptr<const ObjectIndex> LookupIndex() const;
  std::shared_ptr<const ObjectIndex> RequireIndex(const std::string& operation) const;

  const std::shared_ptr<const ObjectHandle> handle_;
  const std::shared_ptr<AbstractExecutor> executor_;
  const std::shared_ptr<IndexStore> index_store_;

  mutable std::mutex index_mutex_;
  mutable std::shared_ptr<const ObjectIndex> index_;
};

}  // namespace seqpart
