#include "execution/execution_adapter.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "execution/local_executor.hpp"

namespace seqpart {

namespace {

// Runs jobs in reverse order on the calling thread and records the size of every batch.
class ReversingExecutor : public AbstractExecutor {
 public:
  void ExecuteAll(const std::vector<std::function<void()>>& jobs) override {
    batch_sizes.push_back(jobs.size());
    for (auto job = jobs.rbegin(); job != jobs.rend(); ++job) {
      (*job)();
    }
  }

  size_t Concurrency() const override { return 1; }

  std::vector<size_t> batch_sizes;
};

}  // namespace

class ExecutionAdapterTest : public ::testing::Test {
 protected:
  LocalExecutor executor_{4};
};

TEST_F(ExecutionAdapterTest, ResultsFollowInputOrder) {
  std::vector<int> units(64);
  for (size_t i = 0; i < units.size(); ++i) {
    units[i] = static_cast<int>(i);
  }

  const std::vector<int> results = MapUnits(executor_, units, [](const int& unit) {
    // Later units finish first.
    std::this_thread::sleep_for(std::chrono::microseconds(64 - unit));
    return unit * 2;
  });

  ASSERT_EQ(results.size(), units.size());
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i], static_cast<int>(2 * i));
  }
}

TEST_F(ExecutionAdapterTest, OrderIsIndependentOfExecutionOrder) {
  ReversingExecutor executor;
  const std::vector<std::string> units = {"a", "b", "c"};

  const auto results = MapUnits(executor, units, [](const std::string& unit) { return unit + unit; });

  EXPECT_EQ(results, (std::vector<std::string>{"aa", "bb", "cc"}));
}

TEST_F(ExecutionAdapterTest, EmptyInput) {
  const std::vector<int> units;
  const auto results = MapUnits(executor_, units, [](const int& unit) { return unit; });
  EXPECT_TRUE(results.empty());
}

TEST_F(ExecutionAdapterTest, LowestFailingOrdinalWins) {
  ReversingExecutor executor;
  const std::vector<int> units = {0, 1, 2, 3};

  // The reversing executor fails unit 3 before unit 1, but unit 1 is reported.
  EXPECT_THROW(
      try {
        MapUnits(executor, units, [](const int& unit) {
          if (unit % 2 == 1) {
            throw std::runtime_error("unit " + std::to_string(unit));
          }
          return unit;
        });
      } catch (const std::runtime_error& error) {
        EXPECT_STREQ(error.what(), "unit 1");
        throw;
      },
      std::runtime_error);
}

TEST_F(ExecutionAdapterTest, WavesBoundConcurrency) {
  ReversingExecutor executor;
  const std::vector<int> units(10, 1);

  const auto results = MapUnits(executor, units, [](const int& unit) { return unit; }, 4);

  EXPECT_EQ(results.size(), 10);
  EXPECT_EQ(executor.batch_sizes, (std::vector<size_t>{4, 4, 2}));
}

TEST_F(ExecutionAdapterTest, FailedWaveStopsLaterWaves) {
  ReversingExecutor executor;
  const std::vector<int> units = {0, 1, 2, 3, 4, 5};
  std::atomic_uint32_t num_invocations = 0;

  EXPECT_THROW(MapUnits(
                   executor, units,
                   [&num_invocations](const int& unit) {
                     ++num_invocations;
                     if (unit == 0) {
                       throw std::runtime_error("first unit");
                     }
                     return unit;
                   },
                   2),
               std::runtime_error);

  EXPECT_EQ(num_invocations, 2u);
  EXPECT_EQ(executor.batch_sizes.size(), 1);
}

TEST_F(ExecutionAdapterTest, WavesOnThreadPool) {
  std::mutex mutex;
  size_t concurrent = 0;
  size_t max_concurrent = 0;
  const std::vector<int> units(32, 0);

  MapUnits(
      executor_, units,
      [&](const int& unit) {
        {
          const std::lock_guard<std::mutex> lock(mutex);
          max_concurrent = std::max(max_concurrent, ++concurrent);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        {
          const std::lock_guard<std::mutex> lock(mutex);
          --concurrent;
        }
        return unit;
      },
      3);

  EXPECT_LE(max_concurrent, 3);
  EXPECT_GE(max_concurrent, 1);
}

}  // namespace seqpart
