#include "common/cancellation.hpp"
#include <algorithm>
#include <thread>

bool PauseFor(std::chrono::milliseconds duration, const CancellationToken* token) {
  static constexpr std::chrono::milliseconds kSlice{100};
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (true) {
    if (token && token->IsCancelled()) return false;
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return true;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(left, kSlice));
  }
}
