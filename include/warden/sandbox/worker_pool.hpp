#pragma once

#include "warden/common/result.hpp"
#include "warden/observability/global.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace warden::sandbox {

/// Fixed set of threads shared by every session. Work queues without bound;
/// the number of concurrently running commands is what stays bounded.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename Fn>
  [[nodiscard]] common::Result<std::future<std::invoke_result_t<Fn>>> submit(Fn fn) {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto future = task->get_future();
    std::size_t depth = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return common::Result<std::future<R>>::failure("worker pool is shut down");
      }
      jobs_.emplace_back([task] { (*task)(); });
      depth = jobs_.size();
    }
    cv_.notify_one();
    observability::record_metric(observability::WorkerQueueDepthMetric{.depth = depth});
    return common::Result<std::future<R>>::success(std::move(future));
  }

  void shutdown();

  [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  std::vector<std::thread> threads_;
  bool stopping_ = false;
};

} // namespace warden::sandbox
