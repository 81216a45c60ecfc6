#include <citegraph/worker_pool.h>

#include <atomic>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace citegraph {
namespace {

TEST(WorkerPoolTest, MapKeepsInputOrder) {
  const WorkerPool pool(4);
  std::vector<int> items(1000);
  std::iota(items.begin(), items.end(), 0);

  const auto results =
      pool.Map(items, [](int value) { return std::to_string(value * 2); });

  ASSERT_EQ(items.size(), results.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(std::to_string(items[i] * 2), results[i]);
  }
}

TEST(WorkerPoolTest, VisitsEveryIndexOnce) {
  const WorkerPool pool(8);
  std::vector<std::atomic<int>> visits(257);

  pool.ForEachIndex(visits.size(), [&](std::size_t index) { ++visits[index]; });

  for (const auto &count : visits) {
    EXPECT_EQ(1, count.load());
  }
}

TEST(WorkerPoolTest, RethrowsTaskFailure) {
  const WorkerPool pool(4);
  std::vector<int> items(100, 1);
  items[37] = -1;

  EXPECT_THROW(pool.Map(items,
                        [](int value) {
                          if (value < 0) {
                            throw std::runtime_error("negative");
                          }
                          return value;
                        }),
               std::runtime_error);
}

TEST(WorkerPoolTest, SingleWorkerRunsOnCallingThread) {
  const WorkerPool pool(1);
  const auto caller = std::this_thread::get_id();
  std::vector<std::thread::id> seen;

  pool.ForEachIndex(3, [&](std::size_t) {
    seen.push_back(std::this_thread::get_id());
  });

  EXPECT_THAT(seen, ::testing::Each(caller));
  EXPECT_EQ(3u, seen.size());
}

TEST(WorkerPoolTest, DefaultsToBoundedHardwareConcurrency) {
  const WorkerPool pool;

  EXPECT_GE(pool.Size(), 1u);
  EXPECT_LE(pool.Size(), 16u);
  EXPECT_EQ(WorkerPool::DefaultThreadCount(), pool.Size());
}

TEST(WorkerPoolTest, EmptyInputProducesNothing) {
  const WorkerPool pool(4);
  const std::vector<int> items;

  EXPECT_TRUE(pool.Map(items, [](int value) { return value; }).empty());
}

} // namespace
} // namespace citegraph
