#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace farmstock::core {

// Fixed-size worker pool for independent CPU-bound jobs (batch plan sweeps).
//
// parallelFor() also drains work on the calling thread. Do not call it from
// inside a pool job: the inner wait can block on helpers queued behind it.
class JobSystem {
public:
  // threadCount == 0 picks hardware_concurrency() (4 if unknown).
  explicit JobSystem(std::size_t threadCount = 0) {
    if (threadCount == 0) threadCount = defaultThreadCount();
    threadCount_ = threadCount;

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
      threads_.emplace_back([this]() { workerLoop(); });
    }
  }

  ~JobSystem() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  std::size_t threadCount() const { return threadCount_; }

  static std::size_t defaultThreadCount() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? static_cast<std::size_t>(hc) : 4;
  }

  // Thread count for a configured value: 0 or less picks the default, and
  // requests above 4x the hardware concurrency are capped.
  static std::size_t clampThreadCount(long long requested) {
    const std::size_t hw = defaultThreadCount();
    if (requested <= 0) return hw;
    return std::min(static_cast<std::size_t>(requested), 4 * hw);
  }

  template <class F, class... Args>
  auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using R = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<R()>>(
      [func = std::forward<F>(f), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
        return std::apply(std::move(func), std::move(tup));
      });
    std::future<R> fut = task->get_future();

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (stopping_) {
        lock.unlock();
        (*task)();
        return fut;
      }
      queue_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Calls fn(i) once for every i in [0, count). If fn throws, the first
  // exception is rethrown after all helpers have stopped.
  template <class Fn>
  void parallelFor(std::size_t count, Fn&& fn) {
    if (count == 0) return;
    if (threadCount_ <= 1 || count == 1) {
      for (std::size_t i = 0; i < count; ++i) fn(i);
      return;
    }

    std::atomic<std::size_t> next{0};
    auto drain = [&]() {
      for (;;) {
        const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
        if (i >= count) break;
        fn(i);
      }
    };

    const std::size_t helpers = std::min(threadCount_, count) - 1;
    std::vector<std::future<void>> futs;
    futs.reserve(helpers);
    for (std::size_t h = 0; h < helpers; ++h) futs.push_back(submit(drain));

    // Helpers use `next` and `drain` from this frame, so every one of them
    // must finish before an exception may leave it.
    std::exception_ptr callerError;
    try {
      drain();
    } catch (...) {
      callerError = std::current_exception();
      next.store(count, std::memory_order_relaxed);
    }
    for (auto& f : futs) f.wait();
    if (callerError) std::rethrow_exception(callerError);
    for (auto& f : futs) f.get();
  }

private:
  void workerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) return;
        task = std::move(queue_.front());
        queue_.pop_front();
      }
      task();
    }
  }

  std::size_t threadCount_{1};
  std::vector<std::thread> threads_{};

  std::mutex mutex_{};
  std::condition_variable cv_{};
  std::deque<std::function<void()>> queue_{};
  bool stopping_{false};
};

} // namespace farmstock::core
