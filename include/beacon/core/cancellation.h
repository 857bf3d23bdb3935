#pragma once

#include <atomic>

namespace beacon::core {

// CancellationToken is shared between a caller and a long-running operation.
// The operation polls is_cancelled() between units of work; it never blocks.
class CancellationToken {
 public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace beacon::core
