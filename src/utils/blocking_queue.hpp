#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace stele::utils {

// 有界的多生产者多消费者队列。
// close() 之后 push 失败，pop 继续取出剩余元素，取完才返回 false。
template <typename T>
class BlockingQueue {
public:
  explicit BlockingQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  bool push(T item) {
    std::unique_lock ul(lock_);
    not_full_.wait(ul, [this]() { return closed_ || items_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    items_.emplace_back(std::move(item));
    ul.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool pop(T& out) {
    std::unique_lock ul(lock_);
    not_empty_.wait(ul, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    ul.unlock();
    not_full_.notify_one();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lg(lock_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  [[nodiscard]] bool closed() {
    std::lock_guard<std::mutex> lg(lock_);
    return closed_;
  }

private:
  const size_t capacity_;
  std::deque<T> items_;
  bool closed_ = false;
  //
  std::mutex lock_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
};

}  // namespace stele::utils
