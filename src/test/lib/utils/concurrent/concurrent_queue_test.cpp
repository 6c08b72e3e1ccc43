#include "utils/concurrent/concurrent_queue.hpp"

#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace seqpart {

TEST(ConcurrentQueueTest, PopsInInsertionOrder) {
  ConcurrentQueue<int> queue;
  EXPECT_TRUE(queue.Push(1));
  EXPECT_TRUE(queue.Push(2));
  EXPECT_EQ(queue.Size(), 2);

  int value = 0;
  ASSERT_TRUE(queue.TryPop(&value));
  EXPECT_EQ(value, 1);
  ASSERT_TRUE(queue.Pop(&value));
  EXPECT_EQ(value, 2);
  EXPECT_FALSE(queue.TryPop(&value));
}

TEST(ConcurrentQueueTest, CloseRejectsPushesAndWakesConsumers) {
  ConcurrentQueue<int> queue;
  bool popped = true;
  std::thread consumer([&]() {
    int value = 0;
    popped = queue.Pop(&value);
  });

  queue.Close();
  consumer.join();

  EXPECT_FALSE(popped);
  EXPECT_FALSE(queue.Push(3));
}

TEST(ConcurrentQueueTest, ManyProducers) {
  constexpr int kNumProducers = 4;
  constexpr int kValuesPerProducer = 1000;
  ConcurrentQueue<int> queue;

  std::vector<std::thread> producers;
  producers.reserve(kNumProducers);
  for (int producer = 0; producer < kNumProducers; ++producer) {
    producers.emplace_back([&queue]() {
      for (int i = 0; i < kValuesPerProducer; ++i) {
        queue.Push(1);
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  queue.Close();

  int sum = 0;
  int value = 0;
  while (queue.Pop(&value)) {
    sum += value;
  }
  EXPECT_EQ(sum, kNumProducers * kValuesPerProducer);
}

}  // namespace seqpart
