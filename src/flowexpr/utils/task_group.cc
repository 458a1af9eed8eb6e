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

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

#include "src/flowexpr/utils/logger.h"

namespace flowexpr {
namespace utils {

TaskGroup::~TaskGroup() { Wait(); }

void TaskGroup::Spawn(std::function<void()> task) {
  tasks_.push_back(std::move(task));
}

void TaskGroup::Wait() {
  if (tasks_.empty()) {
    return;
  }
  std::vector<std::function<void()>> tasks;
  tasks.swap(tasks_);

  const size_t workers = std::min(tasks.size(), max_workers_);
  FLOWEXPR_DEBUG("Running %zu queued tasks on %zu workers", tasks.size(),
                 workers);

  std::atomic<size_t> next{0};
  auto drain = [&tasks, &next] {
    for (size_t i = next++; i < tasks.size(); i = next++) {
      tasks[i]();
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    try {
      threads.emplace_back(drain);
    } catch (const std::system_error& e) {
      // The started workers drain the whole queue.
      FLOWEXPR_WARN("Started %zu of %zu task workers: %s", threads.size(),
                    workers, e.what());
      break;
    }
  }
  if (threads.empty()) {
    drain();
  }
  for (std::thread& thread : threads) {
    thread.join();
  }
}

}  // namespace utils
}  // namespace flowexpr
