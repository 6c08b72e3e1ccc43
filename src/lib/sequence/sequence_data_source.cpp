#include "sequence_data_source.hpp"

#include <optional>
#include <utility>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "errors.hpp"
#include "partitioner.hpp"
#include "utils/assert.hpp"

namespace seqpart {

SequenceDataSource::SequenceDataSource(std::shared_ptr<const ObjectHandle> handle,
                                       std::shared_ptr<AbstractExecutor> executor,
                                       std::shared_ptr<IndexStore> index_store)
    : handle_(std::move(handle)), executor_(std::move(executor)), index_store_(std::move(index_store)) {
  Assert(handle_ != nullptr, "A data source needs an object handle.");
  Assert(executor_ != nullptr, "A data source needs an executor.");
}

std::shared_ptr<const ObjectIndex> SequenceDataSource::Preprocess(const PreprocessConfig& config) {
  std::shared_ptr<const ObjectIndex> index;

  if (index_store_ != nullptr) {
    std::optional<ObjectIndex> stored_index = index_store_->Load(*handle_, config);
    if (stored_index.has_value()) {
      AWS_LOGSTREAM_INFO(kPreprocessorTag.c_str(), "Reusing stored index of " << handle_->Locator() << ".");
      index = std::make_shared<const ObjectIndex>(std::move(*stored_index));
    }
  }

  if (index == nullptr) {
    index = std::make_shared<const ObjectIndex>(Preprocessor(executor_).Preprocess(handle_, config));
    if (index_store_ != nullptr) {
      try {
        index_store_->Store(*handle_, config, *index);
      } catch (const SeqpartError& error) {
        // The index in memory stays usable.
        AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Index of " << handle_->Locator()
                                                               << " was not persisted: " << error.what());
      }
    }
  }

  const std::lock_guard<std::mutex> lock(index_mutex_);
  index_ = index;
  return index;
}

std::shared_ptr<const ObjectIndex> SequenceDataSource::LookupIndex() const {
  const std::lock_guard<std::mutex> lock(index_mutex_);
  if (index_ == nullptr && index_store_ != nullptr) {
    std::optional<ObjectIndex> stored_index = index_store_->LoadAny(*handle_);
    if (stored_index.has_value()) {
      index_ = std::make_shared<const ObjectIndex>(std::move(*stored_index));
    }
  }
  return index_;
}

std::shared_ptr<const ObjectIndex> SequenceDataSource::RequireIndex(const std::string& operation) const {
  std::shared_ptr<const ObjectIndex> index = LookupIndex();
  if (index == nullptr) {
    throw PreconditionError(operation + " requires " + handle_->Locator().ToUri() + " to be preprocessed first.");
  }
  return index;
}

bool SequenceDataSource::IsPreprocessed() const { return LookupIndex() != nullptr; }

std::vector<PartitionSlice> SequenceDataSource::Partition(const AbstractPartitionStrategy& strategy,
                                                          const PartitionParameters& parameters) const {
  // Invalid parameters are reported before the missing index.
  [[maybe_unused]] const size_t num_chunks = parameters.ResolveChunkCount(handle_->Size());
  const std::shared_ptr<const ObjectIndex> index = RequireIndex("Partitioning");
  return Partitioner::Partition(handle_, *index, strategy, parameters);
}

std::vector<PartitionSlice> SequenceDataSource::Partition(PartitionStrategyType strategy_type,
                                                          const PartitionParameters& parameters) const {
  return Partition(*CreatePartitionStrategy(strategy_type), parameters);
}

Attributes SequenceDataSource::GetAttributes() const { return Attributes(RequireIndex("Reading attributes")); }

}  // namespace seqpart
