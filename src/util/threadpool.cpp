// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace shapefuzz {
namespace util {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4; // hardware_concurrency() may report 0
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i] { WorkerLoop(i); });
  }
  LOG_DEBUG("ThreadPool started with {} workers", num_threads);
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::WorkerLoop(size_t index) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });

      if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // Task exceptions land in the packaged_task's future; anything that
    // still escapes is a broken task wrapper and is logged before the
    // worker moves on.
    try {
      task();
    } catch (const std::exception &e) {
      LOG_APP_ERROR("ThreadPool worker {} caught exception: {}", index, e.what());
    }
    tasks_completed_.fetch_add(1, std::memory_order_relaxed);
  }
}

void ThreadPool::shutdown() {
  stop_.store(true, std::memory_order_release);
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace shapefuzz
