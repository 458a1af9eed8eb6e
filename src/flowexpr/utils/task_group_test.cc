/* Copyright 2024 The flowexpr Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "src/flowexpr/utils/task_group.h"

#include <atomic>
#include <vector>

#include "absl/synchronization/barrier.h"
#include "gtest/gtest.h"

namespace flowexpr {
namespace utils {
namespace {

TEST(TaskGroupTest, NothingRunsBeforeWait) {
  std::atomic<int> runs{0};
  TaskGroup group;
  group.Spawn([&runs] { ++runs; });
  group.Spawn([&runs] { ++runs; });
  EXPECT_EQ(0, runs.load());
  EXPECT_EQ(2u, group.pending());

  group.Wait();
  EXPECT_EQ(2, runs.load());
  EXPECT_EQ(0u, group.pending());
}

// Every task blocks until all of them started, which only completes when
// they run concurrently.
TEST(TaskGroupTest, TasksRunConcurrently) {
  constexpr int kNumTasks = 8;
  absl::Barrier* barrier = new absl::Barrier(kNumTasks);
  std::atomic<int> runs{0};

  TaskGroup group;
  for (int i = 0; i < kNumTasks; ++i) {
    group.Spawn([&barrier, &runs] {
      if (barrier->Block()) {
        delete barrier;
      }
      ++runs;
    });
  }
  group.Wait();
  EXPECT_EQ(kNumTasks, runs.load());
}

TEST(TaskGroupTest, WorkersAreCapped) {
  constexpr int kNumTasks = 1000;
  std::atomic<int> runs{0};
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  TaskGroup group(4);
  for (int i = 0; i < kNumTasks; ++i) {
    group.Spawn([&] {
      int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      ++runs;
      --running;
    });
  }
  group.Wait();
  EXPECT_EQ(kNumTasks, runs.load());
  EXPECT_LE(peak.load(), 4);
  EXPECT_GE(peak.load(), 1);
}

TEST(TaskGroupTest, SingleWorkerRunsInOrder) {
  std::vector<int> order;
  TaskGroup group(1);
  for (int i = 0; i < 5; ++i) {
    group.Spawn([&order, i] { order.push_back(i); });
  }
  group.Wait();
  EXPECT_EQ((std::vector<int>{0, 1, 2, 3, 4}), order);
}

TEST(TaskGroupTest, DestructorWaits) {
  std::atomic<int> runs{0};
  {
    TaskGroup group;
    group.Spawn([&runs] { ++runs; });
  }
  EXPECT_EQ(1, runs.load());
}

}  // namespace
}  // namespace utils
}  // namespace flowexpr
