#pragma once

#include <atomic>

namespace model_batcher {

// =============================================================================
// JobTicketThrottle
// -----------------------------------------------------------------------------
// Admission credits. Consumers publish a ticket when they start waiting for
// data work; each admitted job consumes one. The count never goes negative
// through try_acquire().
// =============================================================================
class JobTicketThrottle {
 public:
  explicit JobTicketThrottle(bool enabled) : enabled_(enabled) {}

  [[nodiscard]] auto enabled() const -> bool { return enabled_; }

  auto increment() -> int { return tickets_.fetch_add(1) + 1; }
  auto decrement() -> int { return tickets_.fetch_sub(1) - 1; }

  // Compare-and-decrement: the zero check and the decrement are one step.
  [[nodiscard]] auto try_acquire() -> bool
  {
    int current = tickets_.load(std::memory_order_acquire);
    while (current > 0) {
      if (tickets_.compare_exchange_weak(
              current, current - 1, std::memory_order_acq_rel,
              std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] auto available() const -> int
  {
    return tickets_.load(std::memory_order_acquire);
  }

 private:
  const bool enabled_;
  std::atomic<int> tickets_{0};
};

}  // namespace model_batcher
