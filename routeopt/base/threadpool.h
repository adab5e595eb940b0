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

#ifndef ROUTEOPT_BASE_THREADPOOL_H_
#define ROUTEOPT_BASE_THREADPOOL_H_

#include <condition_variable>  // NOLINT
#include <functional>
#include <list>
#include <mutex>  // NOLINT
#include <string>
#include <thread>  // NOLINT
#include <vector>

#include "absl/strings/string_view.h"

namespace route_optimization {

// Fixed-size pool of worker threads consuming closures in FIFO order.
// The destructor drains the queue: every scheduled closure runs before the
// workers are joined, so closures may safely reference objects that outlive
// the pool.
class ThreadPool {
 public:
  ThreadPool(absl::string_view prefix, int num_threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void StartWorkers();
  void Schedule(std::function<void()> closure);
  std::function<void()> GetNextTask();

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

}  // namespace route_optimization

#endif  // ROUTEOPT_BASE_THREADPOOL_H_
