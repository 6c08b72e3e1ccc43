#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "object_index.hpp"
#include "types.hpp"

namespace seqpart {

enum class PartitionStrategyType { kContiguous, kRecordAligned, kCustom };

/**
 * Either a partition count or a target partition size. num_chunks is signed so that negative requests can be rejected
 * instead of wrapping around.
 */
struct PartitionParameters {
  int64_t num_chunks = 0;
  std::optional<uint64_t> chunk_size_bytes;

  static PartitionParameters WithChunkCount(int64_t num_chunks) { return {num_chunks, std::nullopt}; }
  static PartitionParameters WithChunkSize(uint64_t chunk_size_bytes) { return {0, chunk_size_bytes}; }

  /**
   * Returns the number of partitions to plan for an object of @param total_size_bytes. A chunk size takes precedence
   * over the count. Throws an InvalidArgumentError for non-positive counts or a zero chunk size.
   */
  size_t ResolveChunkCount(uint64_t total_size_bytes) const;
};

/**
 * A partitioning policy. Every plan consists of contiguous, non-overlapping, increasing ranges whose union is
 * [0, index.total_size_bytes).
 */
class AbstractPartitionStrategy {
 public:
  virtual ~AbstractPartitionStrategy() = default;

  virtual PartitionStrategyType Type() const = 0;
  virtual std::vector<ByteRange> Plan(const ObjectIndex& index, const PartitionParameters& parameters) const = 0;
};

/**
 * Cuts the object into num_chunks ranges of ceil(total_size / num_chunks) bytes. The last range may be shorter and,
 * with more chunks than bytes, trailing ranges are empty. Cut points ignore record boundaries.
 */
class ContiguousPartitionStrategy : public AbstractPartitionStrategy {
 public:
  PartitionStrategyType Type() const override { return PartitionStrategyType::kContiguous; }
  std::vector<ByteRange> Plan(const ObjectIndex& index, const PartitionParameters& parameters) const override;
};

/**
 * Moves every contiguous cut point forward to the next record start, so that no record is split. Always plans
 * num_chunks ranges; when records are fewer than chunks, trailing ranges are empty. A preamble belongs to the first
 * range.
 */
class RecordAlignedPartitionStrategy : public AbstractPartitionStrategy {
 public:
  PartitionStrategyType Type() const override { return PartitionStrategyType::kRecordAligned; }
  std::vector<ByteRange> Plan(const ObjectIndex& index, const PartitionParameters& parameters) const override;
};

/**
 * Delegates planning to a caller-supplied function and rejects plans that violate the coverage invariants.
 */
class CustomPartitionStrategy : public AbstractPartitionStrategy {
 public:
  using PlanFunction = std::function<std::vector<ByteRange>(const ObjectIndex&, const PartitionParameters&)>;

  explicit CustomPartitionStrategy(PlanFunction plan_function);

  PartitionStrategyType Type() const override { return PartitionStrategyType::kCustom; }
  std::vector<ByteRange> Plan(const ObjectIndex& index, const PartitionParameters& parameters) const override;

 private:
  PlanFunction plan_function_;
};

/**
 * Throws an InvalidArgumentError unless @param plan tiles [0, total_size_bytes) in order.
 */
void ValidatePlan(const std::vector<ByteRange>& plan, uint64_t total_size_bytes);

/**
 * Creates one of the built-in strategies. kCustom needs a plan function and is rejected.
 */
std::shared_ptr<AbstractPartitionStrategy> CreatePartitionStrategy(PartitionStrategyType type);

/**
 * Parses the command line names "contiguous" and "record-aligned".
 */
PartitionStrategyType PartitionStrategyTypeFromName(const std::string& name);
std::string PartitionStrategyTypeToName(PartitionStrategyType type);

}  // namespace seqpart
