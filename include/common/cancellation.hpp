#pragma once
#include <atomic>
#include <chrono>
#include <functional>

// Cooperative, coarse cancellation flag. Set from a signal handler or another
// thread; checked by long-running loops at step boundaries.
class CancellationToken {
public:
  void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }
  bool IsCancelled() const { return cancelled_.load(std::memory_order_relaxed); }
private:
  std::atomic<bool> cancelled_{false};
};

// Sleeps for `duration`, waking early when `token` is cancelled.
// Returns false if the pause was cut short by cancellation.
bool PauseFor(std::chrono::milliseconds duration, const CancellationToken* token);

// Signature of PauseFor, for components that take the pause as a collaborator.
using PauseFunction = std::function<bool(std::chrono::milliseconds, const CancellationToken*)>;
