#include "utils/tbb_manager.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

TEST(TBBManagerTest, ParsesParallelControl) {
  auto defines =
      utils::TBBManager::ParseParallelControl("transfer:8,resolve:4,broken,x:y");
  ASSERT_EQ(defines.size(), 2u);
  EXPECT_EQ(defines["transfer"], 8);
  EXPECT_EQ(defines["resolve"], 4);
  EXPECT_TRUE(utils::TBBManager::ParseParallelControl("").empty());
}

TEST(TBBManagerTest, RunsEnqueuedTasksAndContainsExceptions) {
  auto& tbb = utils::TBBManager::GetInstance();
  tbb.Init("test", 2);
  EXPECT_EQ(tbb.Concurrency("test"), 2);
  EXPECT_THROW(tbb.Concurrency("never-initialized"), std::runtime_error);

  std::atomic<int> done{0};
  tbb.Enqueue("test", []() { throw std::runtime_error("task bug"); });
  for (int i = 0; i < 4; ++i) tbb.Enqueue("test", [&done]() { ++done; });

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (done.load() < 4 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(done.load(), 4);
}
