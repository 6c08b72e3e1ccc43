#include "partition_strategy.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include <magic_enum/magic_enum.hpp>

#include "errors.hpp"
#include "utils/assert.hpp"
#include "utils/string.hpp"

namespace seqpart {

namespace {

const std::string kContiguousStrategyName = "contiguous";
const std::string kRecordAlignedStrategyName = "record-aligned";

uint64_t CeilDivide(uint64_t dividend, uint64_t divisor) { return (dividend + divisor - 1) / divisor; }

// The i-th of num_chunks equally sized cut points, clamped to the object size.
ByteOffset ContiguousCutPoint(uint64_t total_size_bytes, size_t num_chunks, size_t i) {
  const uint64_t chunk_size = CeilDivide(total_size_bytes, num_chunks);
  return std::min<ByteOffset>(chunk_size * i, total_size_bytes);
}

}  // namespace

size_t PartitionParameters::ResolveChunkCount(uint64_t total_size_bytes) const {
  if (chunk_size_bytes.has_value()) {
    if (*chunk_size_bytes == 0) {
      throw InvalidArgumentError("The partition size must be positive.");
    }
    return std::max<size_t>(CeilDivide(total_size_bytes, *chunk_size_bytes), 1);
  }

  if (num_chunks <= 0) {
    throw InvalidArgumentError("The number of partitions must be positive, but is " + std::to_string(num_chunks) +
                               ".");
  }
  return static_cast<size_t>(num_chunks);
}

std::vector<ByteRange> ContiguousPartitionStrategy::Plan(const ObjectIndex& index,
                                                         const PartitionParameters& parameters) const {
  const uint64_t total_size_bytes = index.total_size_bytes;
  const size_t num_chunks = parameters.ResolveChunkCount(total_size_bytes);

  std::vector<ByteRange> plan;
  plan.reserve(num_chunks);
  for (size_t i = 0; i < num_chunks; ++i) {
    plan.push_back({ContiguousCutPoint(total_size_bytes, num_chunks, i),
                    ContiguousCutPoint(total_size_bytes, num_chunks, i + 1)});
  }
  return plan;
}

std::vector<ByteRange> RecordAlignedPartitionStrategy::Plan(const ObjectIndex& index,
                                                            const PartitionParameters& parameters) const {
  const uint64_t total_size_bytes = index.total_size_bytes;
  const size_t num_chunks = parameters.ResolveChunkCount(total_size_bytes);

  std::vector<ByteRange> plan;
  plan.reserve(num_chunks);
  ByteOffset previous_cut = 0;
  for (size_t i = 1; i <= num_chunks; ++i) {
    const ByteOffset ideal_cut = ContiguousCutPoint(total_size_bytes, num_chunks, i);
    // Cut points only move forward, so they stay monotonic even if a record spans several ideal cuts.
    const ByteOffset cut = i == num_chunks ? total_size_bytes : std::max(previous_cut, index.NextRecordStart(ideal_cut));
    plan.push_back({previous_cut, cut});
    previous_cut = cut;
  }
  return plan;
}

CustomPartitionStrategy::CustomPartitionStrategy(PlanFunction plan_function)
    : plan_function_(std::move(plan_function)) {
  if (!plan_function_) {
    throw InvalidArgumentError("A custom partition strategy needs a plan function.");
  }
}

std::vector<ByteRange> CustomPartitionStrategy::Plan(const ObjectIndex& index,
                                                     const PartitionParameters& parameters) const {
  std::vector<ByteRange> plan = plan_function_(index, parameters);
  ValidatePlan(plan, index.total_size_bytes);
  return plan;
}

void ValidatePlan(const std::vector<ByteRange>& plan, uint64_t total_size_bytes) {
  if (plan.empty()) {
    throw InvalidArgumentError("A partition plan needs at least one range.");
  }

  ByteOffset expected_first_byte = 0;
  for (size_t i = 0; i < plan.size(); ++i) {
    const ByteRange& range = plan[i];
    if (range.first_byte != expected_first_byte || range.end_byte < range.first_byte) {
      std::stringstream message;
      message << "Range " << i << " " << range << " does not continue at byte " << expected_first_byte << ".";
      throw InvalidArgumentError(message.str());
    }
    expected_first_byte = range.end_byte;
  }

  if (expected_first_byte != total_size_bytes) {
    throw InvalidArgumentError("Partition plan ends at byte " + std::to_string(expected_first_byte) +
                               " instead of " + std::to_string(total_size_bytes) + ".");
  }
}

std::shared_ptr<AbstractPartitionStrategy> CreatePartitionStrategy(PartitionStrategyType type) {
  switch (type) {
    case PartitionStrategyType::kContiguous:
      return std::make_shared<ContiguousPartitionStrategy>();
    case PartitionStrategyType::kRecordAligned:
      return std::make_shared<RecordAlignedPartitionStrategy>();
    case PartitionStrategyType::kCustom:
      throw InvalidArgumentError("Custom partition strategies must be constructed with a plan function.");
  }
  Fail("Unexpected partition strategy type " + std::string(magic_enum::enum_name(type)) + ".");
}

PartitionStrategyType PartitionStrategyTypeFromName(const std::string& name) {
  const std::string lower_case_name = ToLowerCase(name);
  if (lower_case_name == kContiguousStrategyName) {
    return PartitionStrategyType::kContiguous;
  }
  if (lower_case_name == kRecordAlignedStrategyName) {
    return PartitionStrategyType::kRecordAligned;
  }
  throw InvalidArgumentError("Unknown partition strategy '" + name + "'.");
}

std::string PartitionStrategyTypeToName(PartitionStrategyType type) {
  switch (type) {
    case PartitionStrategyType::kContiguous:
      return kContiguousStrategyName;
    case PartitionStrategyType::kRecordAligned:
      return kRecordAlignedStrategyName;
    case PartitionStrategyType::kCustom:
      return "custom";
  }
  Fail("Unexpected partition strategy type.");
}

}  // namespace seqpart
