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

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace flowexpr {
namespace utils {

// Queues tasks and runs them concurrently when Wait() is called. At most
// `max_workers` threads pull tasks from the queue; Wait() returns once every
// task finished. Tasks must not throw and must synchronize any state they
// share.
class TaskGroup {
 public:
  static constexpr size_t kDefaultMaxWorkers = 16;

  explicit TaskGroup(size_t max_workers = kDefaultMaxWorkers)
      : max_workers_(max_workers == 0 ? 1 : max_workers) {}
  ~TaskGroup();

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  void Spawn(std::function<void()> task);

  // Runs every queued task and joins the workers. If no worker thread can be
  // started the tasks run on the calling thread. Safe to call repeatedly.
  void Wait();

  size_t pending() const { return tasks_.size(); }

 private:
  const size_t max_workers_;
  std::vector<std::function<void()>> tasks_;
};

}  // namespace utils
}  // namespace flowexpr
