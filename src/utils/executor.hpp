#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "blocking_queue.hpp"

namespace stele::utils {

using AsyncTask = std::function<void()>;

inline unsigned int default_worker_num() {
  const unsigned int n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : n;
}

// 固定数量的工作线程
class Executor {
public:
  explicit Executor(std::string name = "default",
                    unsigned int capacity = 1024,
                    unsigned int worker_num = default_worker_num())
      : name_(std::move(name)), worker_num_(worker_num == 0 ? 1 : worker_num), task_queue_(capacity) {
    workers_.reserve(worker_num_);
    for (unsigned int idx = 0; idx < worker_num_; idx++) {
      workers_.emplace_back([this, idx]() {
        AsyncTask t;
        while (task_queue_.pop(t)) {
          try {
            t();
          } catch (std::exception& err) {
            spdlog::error("Executor-{}-worker-{} occur async task error: {}", name_, idx, err.what());
          }
        }
        spdlog::debug("Executor-{}-worker-{} exit", name_, idx);
      });
    }
  }

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  ~Executor() {
    join();
  }

  bool async_execute(AsyncTask t);
  void join();

  [[nodiscard]] unsigned int worker_num() const {
    return worker_num_;
  }

private:
  std::string name_;
  unsigned int worker_num_;
  //
  BlockingQueue<AsyncTask> task_queue_;
  std::vector<std::thread> workers_;
  std::atomic_bool done_{false};
};

inline bool Executor::async_execute(AsyncTask t) {
  if (done_) {
    return false;
  }
  return task_queue_.push(std::move(t));
}

inline void Executor::join() {
  if (auto expect = false; !done_.compare_exchange_strong(expect, true)) {
    return;
  }
  task_queue_.close();
  for (auto& wt : workers_) {
    if (wt.joinable()) {
      wt.join();
    }
  }
}

class CountDownLatch {
public:
  explicit CountDownLatch(size_t count) : count_(count) {}

  void count_down() {
    std::unique_lock ul(lock_);
    if (count_ > 0 && --count_ == 0) {
      cond_.notify_all();
    }
  }

  void wait() {
    std::unique_lock ul(lock_);
    cond_.wait(ul, [this]() { return count_ == 0; });
  }

private:
  size_t count_;
  std::mutex lock_;
  std::condition_variable cond_;
};

// 结果按输入顺序排列，与各任务完成的先后无关。
// 任一任务抛出异常时，等待全部任务结束后重新抛出下标最小的那个。
template <typename T, typename Func>
auto parallel_map(Executor& executor, const std::vector<T>& inputs, Func func)
    -> std::vector<decltype(func(inputs.front()))> {
  using Result = decltype(func(inputs.front()));
  std::vector<Result> results(inputs.size());
  std::vector<std::exception_ptr> errors(inputs.size());
  CountDownLatch latch(inputs.size());
  for (size_t idx = 0; idx < inputs.size(); idx++) {
    auto task = [&, idx]() {
      try {
        results[idx] = func(inputs[idx]);
      } catch (...) {
        errors[idx] = std::current_exception();
      }
      latch.count_down();
    };
    if (!executor.async_execute(task)) {
      // 执行器已关闭，在调用线程上执行
      task();
    }
  }
  latch.wait();
  for (const auto& err : errors) {
    if (err) {
      std::rethrow_exception(err);
    }
  }
  return results;
}

}  // namespace stele::utils
