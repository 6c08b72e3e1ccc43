#include "partitioner.hpp"

#include <string>

#include <aws/core/utils/logging/LogMacros.h>
#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "errors.hpp"
#include "utils/assert.hpp"

namespace seqpart {

std::vector<PartitionSlice> Partitioner::Partition(const std::shared_ptr<const ObjectHandle>& handle,
                                                   const ObjectIndex& index, const AbstractPartitionStrategy& strategy,
                                                   const PartitionParameters& parameters) {
  Assert(handle != nullptr, "Cannot partition without an object handle.");

  const size_t num_chunks = parameters.ResolveChunkCount(handle->Size());
  if (index.total_size_bytes != handle->Size()) {
    throw PreconditionError("The index of " + handle->Locator().ToUri() + " covers " +
                            std::to_string(index.total_size_bytes) + " bytes, but the object has " +
                            std::to_string(handle->Size()) + ".");
  }

  const std::vector<ByteRange> plan = strategy.Plan(index, parameters);
  ValidatePlan(plan, index.total_size_bytes);
  if (strategy.Type() != PartitionStrategyType::kCustom) {
    Assert(plan.size() == num_chunks, "Built-in strategies plan exactly one range per requested partition.");
  }

  std::vector<PartitionSlice> slices;
  slices.reserve(plan.size());
  for (size_t ordinal = 0; ordinal < plan.size(); ++ordinal) {
    slices.emplace_back(handle, ordinal, plan[ordinal], index.EntriesStartingIn(plan[ordinal]));
  }

  AWS_LOGSTREAM_DEBUG(kPartitionerTag.c_str(), "Planned " << slices.size() << " slices of " << handle->Locator()
                                                          << " with strategy "
                                                          << magic_enum::enum_name(strategy.Type()) << ".");
  return slices;
}

}  // namespace seqpart
