#include "sequence/partition_strategy.hpp"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sequence/errors.hpp"

namespace seqpart {

namespace {

// An index whose records start at @param offsets; the first offset may be greater than zero to model a preamble.
ObjectIndex IndexWithRecordsAt(const std::vector<ByteOffset>& offsets, uint64_t total_size_bytes) {
  ObjectIndex index;
  index.total_size_bytes = total_size_bytes;
  index.format_version = kIndexFormatVersion;
  for (size_t i = 0; i < offsets.size(); ++i) {
    const ByteOffset end = i + 1 < offsets.size() ? offsets[i + 1] : total_size_bytes;
    index.entries.push_back({offsets[i], "r" + std::to_string(i), end - offsets[i]});
  }
  index.record_count = index.entries.size();
  return index;
}

void ExpectTiles(const std::vector<ByteRange>& plan, uint64_t total_size_bytes) {
  ASSERT_FALSE(plan.empty());
  EXPECT_EQ(plan.front().first_byte, 0);
  EXPECT_EQ(plan.back().end_byte, total_size_bytes);
  for (size_t i = 1; i < plan.size(); ++i) {
    EXPECT_EQ(plan[i].first_byte, plan[i - 1].end_byte);
    EXPECT_LE(plan[i].first_byte, plan[i].end_byte);
  }
}

}  // namespace

TEST(PartitionParametersTest, ResolveChunkCount) {
  EXPECT_EQ(PartitionParameters::WithChunkCount(8).ResolveChunkCount(100), 8);
  EXPECT_EQ(PartitionParameters::WithChunkSize(30).ResolveChunkCount(100), 4);
  EXPECT_EQ(PartitionParameters::WithChunkSize(100).ResolveChunkCount(100), 1);
  EXPECT_EQ(PartitionParameters::WithChunkSize(1000).ResolveChunkCount(100), 1);

  const PartitionParameters both{5, 50};
  EXPECT_EQ(both.ResolveChunkCount(100), 2);
}

TEST(PartitionParametersTest, InvalidParameters) {
  EXPECT_THROW(PartitionParameters::WithChunkCount(0).ResolveChunkCount(100), InvalidArgumentError);
  EXPECT_THROW(PartitionParameters::WithChunkSize(0).ResolveChunkCount(100), InvalidArgumentError);

  EXPECT_THROW(
      {
        try {
          PartitionParameters::WithChunkCount(-1).ResolveChunkCount(100);
        } catch (const InvalidArgumentError& error) {
          EXPECT_THAT(error.what(), ::testing::HasSubstr("-1"));
          throw;
        }
      },
      InvalidArgumentError);
}

TEST(ContiguousPartitionStrategyTest, EqualSizedRanges) {
  const ContiguousPartitionStrategy strategy;
  const ObjectIndex index = IndexWithRecordsAt({0}, 10);

  EXPECT_EQ(strategy.Plan(index, PartitionParameters::WithChunkCount(3)),
            (std::vector<ByteRange>{{0, 4}, {4, 8}, {8, 10}}));
  EXPECT_EQ(strategy.Plan(index, PartitionParameters::WithChunkCount(1)), (std::vector<ByteRange>{{0, 10}}));
  EXPECT_EQ(strategy.Plan(index, PartitionParameters::WithChunkSize(5)), (std::vector<ByteRange>{{0, 5}, {5, 10}}));
}

TEST(ContiguousPartitionStrategyTest, CoversObjectForManyChunkCounts) {
  const ContiguousPartitionStrategy strategy;
  for (const uint64_t total_size : {1, 2, 7, 100, 29903}) {
    const ObjectIndex index = IndexWithRecordsAt({0}, total_size);
    for (int64_t num_chunks = 1; num_chunks <= 40; ++num_chunks) {
      SCOPED_TRACE(std::to_string(total_size) + " bytes in " + std::to_string(num_chunks) + " chunks");
      const auto plan = strategy.Plan(index, PartitionParameters::WithChunkCount(num_chunks));
      EXPECT_EQ(plan.size(), num_chunks);
      ExpectTiles(plan, total_size);
      // No range is larger than ceil(total / n).
      for (const auto& range : plan) {
        EXPECT_LE(range.Size(), (total_size + num_chunks - 1) / num_chunks);
      }
    }
  }
}

TEST(ContiguousPartitionStrategyTest, MoreChunksThanBytes) {
  const ContiguousPartitionStrategy strategy;
  const auto plan = strategy.Plan(IndexWithRecordsAt({0}, 3), PartitionParameters::WithChunkCount(5));
  EXPECT_EQ(plan, (std::vector<ByteRange>{{0, 1}, {1, 2}, {2, 3}, {3, 3}, {3, 3}}));
}

TEST(RecordAlignedPartitionStrategyTest, CutsAtRecordStarts) {
  const RecordAlignedPartitionStrategy strategy;
  const ObjectIndex index = IndexWithRecordsAt({0, 10, 50, 90}, 100);

  EXPECT_EQ(strategy.Plan(index, PartitionParameters::WithChunkCount(4)),
            (std::vector<ByteRange>{{0, 50}, {50, 50}, {50, 90}, {90, 100}}));
  EXPECT_EQ(strategy.Plan(index, PartitionParameters::WithChunkCount(2)),
            (std::vector<ByteRange>{{0, 50}, {50, 100}}));
}

TEST(RecordAlignedPartitionStrategyTest, PreambleBelongsToFirstRange) {
  const RecordAlignedPartitionStrategy strategy;
  const ObjectIndex index = IndexWithRecordsAt({30, 60}, 100);

  const auto plan = strategy.Plan(index, PartitionParameters::WithChunkCount(4));
  EXPECT_EQ(plan, (std::vector<ByteRange>{{0, 30}, {30, 60}, {60, 100}, {100, 100}}));
}

TEST(RecordAlignedPartitionStrategyTest, NeverSplitsRecords) {
  const RecordAlignedPartitionStrategy strategy;
  const ObjectIndex index = IndexWithRecordsAt({0, 7, 8, 40, 41, 200, 333, 334, 900}, 1000);

  for (int64_t num_chunks = 1; num_chunks <= 20; ++num_chunks) {
    const auto plan = strategy.Plan(index, PartitionParameters::WithChunkCount(num_chunks));
    EXPECT_EQ(plan.size(), num_chunks);
    ExpectTiles(plan, 1000);
    for (const auto& range : plan) {
      if (range.first_byte > 0 && range.first_byte < 1000) {
        EXPECT_EQ(index.NextRecordStart(range.first_byte), range.first_byte);
      }
    }
  }
}

TEST(CustomPartitionStrategyTest, UsesPlanFunction) {
  const CustomPartitionStrategy strategy([](const ObjectIndex& index, const PartitionParameters& /*parameters*/) {
    return std::vector<ByteRange>{{0, 1}, {1, index.total_size_bytes}};
  });
  EXPECT_EQ(strategy.Type(), PartitionStrategyType::kCustom);
  EXPECT_EQ(strategy.Plan(IndexWithRecordsAt({0}, 10), PartitionParameters::WithChunkCount(7)),
            (std::vector<ByteRange>{{0, 1}, {1, 10}}));
}

TEST(CustomPartitionStrategyTest, RejectsInvalidPlans) {
  const ObjectIndex index = IndexWithRecordsAt({0}, 10);
  const auto plan_returning = [](std::vector<ByteRange> plan) {
    return CustomPartitionStrategy(
        [plan](const ObjectIndex& /*index*/, const PartitionParameters& /*parameters*/) { return plan; });
  };
  const auto parameters = PartitionParameters::WithChunkCount(2);

  EXPECT_THROW(plan_returning({}).Plan(index, parameters), InvalidArgumentError);
  EXPECT_THROW(plan_returning({{0, 4}, {5, 10}}).Plan(index, parameters), InvalidArgumentError);
  EXPECT_THROW(plan_returning({{0, 6}, {4, 10}}).Plan(index, parameters), InvalidArgumentError);
  EXPECT_THROW(plan_returning({{0, 4}, {4, 9}}).Plan(index, parameters), InvalidArgumentError);
  EXPECT_THROW(plan_returning({{1, 10}}).Plan(index, parameters), InvalidArgumentError);

  EXPECT_THROW(CustomPartitionStrategy(nullptr), InvalidArgumentError);
}

TEST(PartitionStrategyTest, CreateByType) {
  EXPECT_EQ(CreatePartitionStrategy(PartitionStrategyType::kContiguous)->Type(), PartitionStrategyType::kContiguous);
  EXPECT_EQ(CreatePartitionStrategy(PartitionStrategyType::kRecordAligned)->Type(),
            PartitionStrategyType::kRecordAligned);
  EXPECT_THROW(CreatePartitionStrategy(PartitionStrategyType::kCustom), InvalidArgumentError);
}

TEST(PartitionStrategyTest, Names) {
  EXPECT_EQ(PartitionStrategyTypeFromName("contiguous"), PartitionStrategyType::kContiguous);
  EXPECT_EQ(PartitionStrategyTypeFromName("Record-Aligned"), PartitionStrategyType::kRecordAligned);
  EXPECT_EQ(PartitionStrategyTypeToName(PartitionStrategyType::kRecordAligned), "record-aligned");
  EXPECT_THROW(PartitionStrategyTypeFromName("balanced"), InvalidArgumentError);
}

}  // namespace seqpart
