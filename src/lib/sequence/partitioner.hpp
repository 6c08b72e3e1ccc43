#pragma once

#include <memory>
#include <vector>

#include "object_handle.hpp"
#include "object_index.hpp"
#include "partition_slice.hpp"
#include "partition_strategy.hpp"

namespace seqpart {

/**
 * Turns a strategy's plan into slices. Partitioning is synchronous and performs no I/O.
 */
class Partitioner {
 public:
  /**
   * Slice i covers the i-th planned range. Throws an InvalidArgumentError for invalid @param parameters and a
   * PreconditionError if @param index was built for another size of the object.
   */
  static std::vector<PartitionSlice> Partition(const std::shared_ptr<const ObjectHandle>& handle,
                                               const ObjectIndex& index, const AbstractPartitionStrategy& strategy,
                                               const PartitionParameters& parameters);
};

}  // namespace seqpart
