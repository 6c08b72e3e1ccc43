#include "storage/io_handle/byte_buffer.hpp"

#include <array>
#include <string>

#include <gtest/gtest.h>

namespace seqpart {

TEST(ByteBufferTest, WriteToView) {
  std::array<uint8_t, 8> memory{};
  ByteBuffer buffer(memory.data(), 8);
  EXPECT_EQ(buffer.Data(), memory.data());
  EXPECT_EQ(buffer.Size(), 0);
  EXPECT_TRUE(buffer.IsExternal());
}

TEST(ByteBufferTest, ResizeInBounds) {
  std::array<uint8_t, 8> memory{};
  ByteBuffer buffer(memory.data(), 8);

  buffer.Resize(5);
  EXPECT_EQ(buffer.Data(), memory.data());
  EXPECT_EQ(buffer.Size(), 5);

  buffer.Resize(8);
  EXPECT_TRUE(buffer.IsExternal());
  EXPECT_EQ(buffer.Size(), 8);
}

TEST(ByteBufferTest, ResizeBeyondExternalCapacityCopiesContent) {
  std::string memory = ">seq1\nAC";
  ByteBuffer buffer(memory.data(), memory.size());
  buffer.Resize(memory.size());

  buffer.Resize(memory.size() + 2);
  EXPECT_FALSE(buffer.IsExternal());
  EXPECT_NE(buffer.CharData(), memory.data());
  EXPECT_EQ(buffer.View().substr(0, memory.size()), memory);
}

TEST(ByteBufferTest, ShrinkingMovesBackToExternalMemory) {
  std::string memory = "ACGTACGT";
  ByteBuffer buffer(memory.data(), memory.size());
  buffer.Resize(10);
  buffer.CharData()[0] = 'N';
  buffer.CharData()[1] = 'N';

  buffer.Resize(1);
  EXPECT_TRUE(buffer.IsExternal());
  EXPECT_EQ(buffer.CharData(), memory.data());
  EXPECT_EQ(memory, "NCGTACGT");
}

TEST(ByteBufferTest, OnlyInternalStorage) {
  ByteBuffer buffer(8);
  EXPECT_FALSE(buffer.IsExternal());
  EXPECT_EQ(buffer.Size(), 0);
  buffer.Resize(10);
  EXPECT_EQ(buffer.Size(), 10);
  EXPECT_EQ(buffer.View().size(), 10);
}

}  // namespace seqpart
