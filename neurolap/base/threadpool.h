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

#ifndef NEUROLAP_BASE_THREADPOOL_H_
#define NEUROLAP_BASE_THREADPOOL_H_

#include <condition_variable>  // NOLINT
#include <functional>
#include <list>
#include <mutex>  // NOLINT
#include <string>
#include <thread>  // NOLINT
#include <vector>

#include "absl/strings/string_view.h"

namespace neurolap {

// A fixed-size pool of worker threads executing closures in FIFO order.
// Closures still queued when the pool is destroyed are run before the workers
// are joined.
class ThreadPool {
 public:
  ThreadPool(absl::string_view prefix, int num_threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void StartWorkers();
  void Schedule(std::function<void()> closure);
  std::function<void()> GetNextTask();

  int num_workers() const { return num_workers_; }
  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  const int num_workers_;
  std::list<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable condition_;
  bool waiting_to_finish_ = false;
  bool started_ = false;
  std::vector<std::thread> all_workers_;
};

}  // namespace neurolap

#endif  // NEUROLAP_BASE_THREADPOOL_H_
