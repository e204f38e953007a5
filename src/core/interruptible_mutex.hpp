#pragma once

#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace model_batcher {

// =============================================================================
// InterruptibleMutex
// -----------------------------------------------------------------------------
// Exclusive lock whose acquisition can be abandoned through a stop token.
// Needed where the holder may block indefinitely and waiters must stay
// cancellable.
// =============================================================================
class InterruptibleMutex {
 public:
  InterruptibleMutex() = default;
  InterruptibleMutex(const InterruptibleMutex&) = delete;
  auto operator=(const InterruptibleMutex&) -> InterruptibleMutex& = delete;
  InterruptibleMutex(InterruptibleMutex&&) = delete;
  auto operator=(InterruptibleMutex&&) -> InterruptibleMutex& = delete;
  ~InterruptibleMutex() = default;

  // Returns false, without owning the lock, when a stop is requested first.
  [[nodiscard]] auto lock(const std::stop_token& stop) -> bool
  {
    std::unique_lock guard(mutex_);
    if (!cv_.wait(guard, stop, [this] { return !locked_; })) {
      return false;
    }
    locked_ = true;
    return true;
  }

  [[nodiscard]] auto try_lock() -> bool
  {
    const std::scoped_lock guard(mutex_);
    if (locked_) {
      return false;
    }
    locked_ = true;
    return true;
  }

  void unlock()
  {
    {
      const std::scoped_lock guard(mutex_);
      locked_ = false;
    }
    cv_.notify_one();
  }

  [[nodiscard]] auto is_locked() const -> bool
  {
    const std::scoped_lock guard(mutex_);
    return locked_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  bool locked_ = false;
};

// Releases the lock on every exit path once owns_lock() is true.
class InterruptibleLockGuard {
 public:
  InterruptibleLockGuard(InterruptibleMutex& mutex, const std::stop_token& stop)
      : mutex_(mutex), owns_(mutex.lock(stop))
  {
  }
  ~InterruptibleLockGuard()
  {
    if (owns_) {
      mutex_.unlock();
    }
  }

  InterruptibleLockGuard(const InterruptibleLockGuard&) = delete;
  auto operator=(const InterruptibleLockGuard&)
      -> InterruptibleLockGuard& = delete;
  InterruptibleLockGuard(InterruptibleLockGuard&&) = delete;
  auto operator=(InterruptibleLockGuard&&) -> InterruptibleLockGuard& = delete;

  [[nodiscard]] auto owns_lock() const -> bool { return owns_; }

 private:
  InterruptibleMutex& mutex_;
  bool owns_;
};

}  // namespace model_batcher
