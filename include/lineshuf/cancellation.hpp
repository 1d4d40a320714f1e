#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

#include "lineshuf/errors.hpp"

namespace lineshuf {

// Set from a signal handler or another thread; polled by the pipeline between records.
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void RequestCancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  [[nodiscard]] bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_relaxed);
  }
  void Reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

  void ThrowIfCancelled(Stage stage, std::optional<std::size_t> chunk = std::nullopt) const;

 private:
  static_assert(std::atomic<bool>::is_always_lock_free);
  std::atomic<bool> cancelled_{false};
};

}  // namespace lineshuf
