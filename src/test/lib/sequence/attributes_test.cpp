#include "sequence/attributes.hpp"

#include <memory>

#include <gtest/gtest.h>

#include "constants.hpp"

namespace seqpart {

TEST(AttributesTest, MeanRecordLengthExcludesPreamble) {
  auto index = std::make_shared<ObjectIndex>();
  index->entries = {{43, "chr1", 37}, {80, "chr2", 28}, {108, "chr3", 54}};
  index->record_count = 3;
  index->total_size_bytes = 162;
  index->format_version = kIndexFormatVersion;

  const Attributes attributes(index);
  EXPECT_EQ(attributes.NumSequences(), 3);
  EXPECT_EQ(attributes.TotalSizeBytes(), 162);
  EXPECT_EQ(attributes.FormatVersion(), kIndexFormatVersion);
  EXPECT_DOUBLE_EQ(attributes.MeanRecordLengthBytes(), 119.0 / 3.0);
}

TEST(AttributesTest, EmptyIndex) {
  const Attributes attributes(std::make_shared<ObjectIndex>());
  EXPECT_EQ(attributes.NumSequences(), 0);
  EXPECT_DOUBLE_EQ(attributes.MeanRecordLengthBytes(), 0.0);
}

}  // namespace seqpart
