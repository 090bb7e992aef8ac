#pragma once

#include <chrono>
#include <functional>
#include <utility>

namespace spatial::perf {

// Reports wall time in microseconds when the scope closes, including on unwind.
class ScopedTimer {
 public:
  using Callback = std::function<void(double)>;

  explicit ScopedTimer(Callback callback)
      : start_(std::chrono::steady_clock::now()), callback_(std::move(callback)) {}

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  ScopedTimer(ScopedTimer&&) = delete;
  ScopedTimer& operator=(ScopedTimer&&) = delete;

  ~ScopedTimer() {
    if (callback_) {
      callback_(elapsed_microseconds());
    }
  }

  [[nodiscard]] double elapsed_microseconds() const {
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::micro>(now - start_).count();
  }

 private:
  std::chrono::steady_clock::time_point start_;
  Callback callback_;
};

}  // namespace spatial::perf
