// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "neurolap/base/threadpool.h"

#include <atomic>
#include <vector>

#include "absl/synchronization/blocking_counter.h"
#include "gtest/gtest.h"

namespace neurolap {
namespace {

TEST(ThreadPoolTest, RunsEveryClosure) {
  const int num_tasks = 10000;  // High enough to catch race conditions.
  std::atomic<int> sum = 0;
  absl::BlockingCounter counter(num_tasks);
  ThreadPool pool("test", 4);
  pool.StartWorkers();
  for (int i = 0; i < num_tasks; ++i) {
    pool.Schedule([&sum, &counter]() {
      sum.fetch_add(1);
      counter.DecrementCount();
    });
  }
  counter.Wait();
  EXPECT_EQ(sum.load(), num_tasks);
}

TEST(ThreadPoolTest, DrainsQueueOnDestruction) {
  std::atomic<int> num_runs = 0;
  {
    ThreadPool pool("drain", 2);
    for (int i = 0; i < 100; ++i) {
      pool.Schedule([&num_runs]() { num_runs.fetch_add(1); });
    }
    pool.StartWorkers();
  }
  EXPECT_EQ(num_runs.load(), 100);
}

TEST(ThreadPoolTest, SingleWorkerRunsInOrder) {
  std::vector<int> order;
  {
    ThreadPool pool("fifo", 1);
    pool.StartWorkers();
    for (int i = 0; i < 20; ++i) {
      pool.Schedule([&order, i]() { order.push_back(i); });
    }
  }
  ASSERT_EQ(order.size(), 20u);
  for (int i = 0; i < 20; ++i) EXPECT_EQ(order[i], i);
}

TEST(ThreadPoolTest, Accessors) {
  ThreadPool pool("named", 3);
  EXPECT_EQ(pool.num_workers(), 3);
  EXPECT_EQ(pool.prefix(), "named");
}

TEST(ThreadPoolDeathTest, RejectsZeroThreads) {
  EXPECT_DEATH(ThreadPool("empty", 0), "ThreadPool 'empty'");
}

}  // namespace
}  // namespace neurolap
