#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdlib>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "dg/parallel/config.hpp"

// Lazily started persistent worker pool shared by every tensor kernel.
//
// Public wrappers:
//   init_pool(n), shutdown_pool(), pool_size(), thread_index(),
//   submit_range(begin, end, fn), wait_for_all()
//
// The first exception thrown by a task is kept, the remaining queued tasks
// are dropped, and wait_for_all() rethrows it on the submitting thread.

namespace dg::parallel {

inline thread_local std::size_t tls_worker_id = static_cast<std::size_t>(-1);

namespace detail {

struct RangeTask {
  std::function<void(std::size_t, std::size_t)> fn;
  std::size_t begin{0}, end{0};
};

class ThreadPool {
 public:
  ThreadPool() = default;
  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void init(std::size_t nthreads = 0) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!workers_.empty()) return;
    std::size_t n = nthreads ? nthreads : get_max_threads();
    if (n == 0) n = 1;
    stop_ = false;
    inflight_ = 0;
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      workers_.emplace_back([this, i]{
        tls_worker_id = i;
        worker_loop();
        tls_worker_id = static_cast<std::size_t>(-1);
      });
    }
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (workers_.empty()) return;
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) if (t.joinable()) t.join();
    std::lock_guard<std::mutex> lk(mu_);
    workers_.clear();
    tasks_.clear();
    inflight_ = 0;
    first_exc_ = nullptr;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return workers_.size();
  }

  void submit(std::size_t begin, std::size_t end,
              std::function<void(std::size_t, std::size_t)> fn) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      tasks_.push_back(RangeTask{std::move(fn), begin, end});
      ++inflight_;
    }
    cv_.notify_one();
  }

  // Blocks until every submitted task finished; rethrows the first failure.
  void wait() {
    std::unique_lock<std::mutex> lk(mu_);
    done_cv_.wait(lk, [this]{ return inflight_ == 0; });
    if (first_exc_) {
      auto ex = first_exc_;
      first_exc_ = nullptr;
      lk.unlock();
      std::rethrow_exception(ex);
    }
  }

 private:
  void worker_loop() noexcept {
    for (;;) {
      RangeTask task;
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this]{ return stop_ || !tasks_.empty(); });
        if (stop_ && tasks_.empty()) return;
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      std::exception_ptr failure;
      {
        NestedParallelGuard nested;
        try {
          task.fn(task.begin, task.end);
        } catch (...) {
          failure = std::current_exception();
        }
      }
      finish(std::move(failure));
    }
  }

  void finish(std::exception_ptr failure) {
    std::lock_guard<std::mutex> lk(mu_);
    if (failure) {
      if (!first_exc_) first_exc_ = std::move(failure);
      inflight_ -= tasks_.size();
      tasks_.clear();
    }
    if (--inflight_ == 0) done_cv_.notify_all();
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable done_cv_;
  std::deque<RangeTask> tasks_;
  std::vector<std::thread> workers_;
  bool stop_{true};
  std::size_t inflight_{0};
  std::exception_ptr first_exc_{nullptr};
};

inline ThreadPool& pool() {
  static ThreadPool p;
  return p;
}

} // namespace detail

inline void init_pool(std::size_t n_threads = 0) { detail::pool().init(n_threads); }
inline void shutdown_pool() { detail::pool().shutdown(); }
inline std::size_t pool_size() { return detail::pool().size(); }

inline std::size_t thread_index() noexcept {
  return (tls_worker_id == static_cast<std::size_t>(-1)) ? 0 : tls_worker_id;
}

inline void submit_range(std::size_t begin, std::size_t end,
                         const std::function<void(std::size_t, std::size_t)>& fn) {
  if (pool_size() == 0) detail::pool().init();
  detail::pool().submit(begin, end, fn);
}

inline void wait_for_all() { detail::pool().wait(); }

} // namespace dg::parallel
