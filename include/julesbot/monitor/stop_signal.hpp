#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace julesbot::monitor {

/// One-shot cancellation flag with an interruptible wait.
class StopSignal {
public:
  void request_stop();
  [[nodiscard]] bool stop_requested() const;

  /// Sleep for up to timeout. Returns true as soon as a stop is requested.
  [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
};

} // namespace julesbot::monitor
