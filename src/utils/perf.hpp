#pragma once

#include <chrono>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace stele::utils {

// 析构时输出阶段耗时
class ScopedTimer {
public:
  explicit ScopedTimer(std::string phase) : phase_(std::move(phase)), start_(std::chrono::steady_clock::now()) {}

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  [[nodiscard]] long long elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_).count();
  }

  void end() {
    if (ended_) {
      return;
    }
    ended_ = true;
    spdlog::info("{} finished in {} ms", phase_, elapsed_ms());
  }

  ~ScopedTimer() {
    end();
  }

private:
  std::string phase_;
  std::chrono::steady_clock::time_point start_;
  bool ended_ = false;
};

}  // namespace stele::utils
