#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "../BackgroundTasks.hpp"

namespace {
void wait_until_idle(const BackgroundTasks& tasks) {
  while (tasks.running() > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}
}  // namespace

TEST(BackgroundTasksTest, FinishedWorkersAreDroppedOnNextStart) {
  BackgroundTasks tasks;
  std::atomic<int> runs = 0;

  for (int i = 0; i < 20; ++i) {
    tasks.start([&runs](std::stop_token) { ++runs; });
    wait_until_idle(tasks);
  }

  EXPECT_EQ(runs.load(), 20);
  EXPECT_EQ(tasks.size(), 1u);
  tasks.join_all();
  EXPECT_EQ(tasks.size(), 0u);
}

TEST(BackgroundTasksTest, RunningWorkerIsKeptUntilItReturns) {
  BackgroundTasks tasks;
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();

  tasks.start([gate](std::stop_token) { gate.wait(); });
  tasks.start([](std::stop_token) {});
  EXPECT_EQ(tasks.size(), 2u);
  EXPECT_GE(tasks.running(), 1u);

  release.set_value();
  tasks.join_all();
  EXPECT_EQ(tasks.running(), 0u);
}

TEST(BackgroundTasksTest, RequestStopReachesWorkers) {
  BackgroundTasks tasks;
  std::atomic<bool> saw_stop = false;

  tasks.start([&saw_stop](std::stop_token stoken) {
    while (!stoken.stop_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    saw_stop = true;
  });
  tasks.request_stop();
  tasks.join_all();

  EXPECT_TRUE(saw_stop.load());
}
