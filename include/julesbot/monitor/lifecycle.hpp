#pragma once

#include "julesbot/monitor/monitor_loop.hpp"

#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace julesbot::monitor {

enum class ToggleResult { Started, Stopped };

/// Single-flight owner of the monitoring run. At most one loop runs at a
/// time; toggle() starts one when idle and stops the running one otherwise.
/// The session state store lives here, so it survives stop/start cycles.
class LifecycleController {
public:
  LifecycleController(jules::ISessionApi &source, INotifier &notifier, MonitorOptions options);
  ~LifecycleController();

  LifecycleController(const LifecycleController &) = delete;
  LifecycleController &operator=(const LifecycleController &) = delete;

  /// Stopping only signals the loop and returns; its thread is reaped by the
  /// next start or by shutdown(). Starting waits for retired loops to exit.
  [[nodiscard]] ToggleResult toggle();

  /// Stop any running loop without a "finished" notice and reap threads.
  void shutdown();

  [[nodiscard]] bool is_active() const;
  [[nodiscard]] const MonitorOptions &options() const { return options_; }

  /// Only safe to read while no loop thread is alive, e.g. after shutdown().
  [[nodiscard]] const SessionStateStore &store() const { return store_; }

private:
  struct Task {
    StopSignal signal;
    std::thread thread;
  };

  void run_task(Task *task);
  [[nodiscard]] bool mark_expired(const Task *task);
  static void join(Task &task);
  static void join_all(std::vector<std::unique_ptr<Task>> &tasks);

  jules::ISessionApi &source_;
  INotifier &notifier_;
  MonitorOptions options_;
  SessionStateStore store_;

  std::mutex toggle_mutex_; // serializes toggle() and shutdown()
  mutable std::mutex state_mutex_;
  bool active_ = false;
  std::unique_ptr<Task> task_;
  std::vector<std::unique_ptr<Task>> retired_; // stopped or expired, not yet joined
};

} // namespace julesbot::monitor
