#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace shapefuzz {
namespace util {

/**
 * Fixed-size worker pool for corpus generation
 *
 * Each task runs on one worker; results and exceptions travel back
 * through the std::future returned by enqueue(). Pending tasks still run
 * after shutdown(); the destructor drains the queue and joins.
 *
 * Usage:
 *   ThreadPool pool(4);
 *   auto future = pool.enqueue([] { return GenerateEntry(0); });
 *   auto entry = future.get();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = hardware concurrency)
   */
  explicit ThreadPool(size_t num_threads = 0);

  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /**
   * Enqueue a task for execution
   * @throws std::runtime_error if the pool is stopped
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Stop accepting new tasks; safe to call multiple times
  void shutdown();

  // Join the workers once the queue is drained; call after shutdown()
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  bool is_stopped() const { return stop_.load(std::memory_order_acquire); }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

private:
  void WorkerLoop(size_t index);

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> tasks_completed_{0};
};

// Implementation of enqueue (must be in header for template)
template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  // packaged_task stores any exception in the future
  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_.load(std::memory_order_acquire)) {
      throw std::runtime_error("enqueue on stopped ThreadPool");
    }
    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace shapefuzz
