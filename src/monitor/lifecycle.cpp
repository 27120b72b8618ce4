#include "julesbot/monitor/lifecycle.hpp"

#include "julesbot/observability/global.hpp"

#include <iostream>
#include <system_error>

namespace julesbot::monitor {

LifecycleController::LifecycleController(jules::ISessionApi &source, INotifier &notifier,
                                         MonitorOptions options)
    : source_(source), notifier_(notifier), options_(std::move(options)) {}

LifecycleController::~LifecycleController() { shutdown(); }

ToggleResult LifecycleController::toggle() {
  std::lock_guard<std::mutex> toggle_lock(toggle_mutex_);

  std::vector<std::unique_ptr<Task>> retired;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (active_) {
      active_ = false;
      task_->signal.request_stop();
      retired_.push_back(std::move(task_));
      return ToggleResult::Stopped;
    }
    retired.swap(retired_);
  }

  // A retired loop may still be inside a fetch; the store has one writer at a
  // time, so it must exit before the next run starts. Joined outside
  // state_mutex_ because an expiring loop takes that lock on its way out.
  join_all(retired);

  std::lock_guard<std::mutex> lock(state_mutex_);
  task_ = std::make_unique<Task>();
  active_ = true;
  Task *task = task_.get();
  task->thread = std::thread([this, task]() { run_task(task); });
  return ToggleResult::Started;
}

void LifecycleController::shutdown() {
  std::lock_guard<std::mutex> toggle_lock(toggle_mutex_);

  std::vector<std::unique_ptr<Task>> pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    active_ = false;
    if (task_ != nullptr) {
      task_->signal.request_stop();
      pending.push_back(std::move(task_));
    }
    for (auto &task : retired_) {
      pending.push_back(std::move(task));
    }
    retired_.clear();
  }
  join_all(pending);
}

bool LifecycleController::is_active() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return active_;
}

void LifecycleController::run_task(Task *task) {
  MonitorLoop loop(source_, notifier_, store_, options_);
  try {
    const auto outcome = loop.run(task->signal, [this, task]() { return mark_expired(task); });
    if (outcome == LoopOutcome::Stopped) {
      std::cerr << "[monitor] loop stopped after " << loop.iterations() << " cycles\n";
    }
  } catch (const std::exception &err) {
    observability::record_error("monitor", std::string("loop aborted: ") + err.what());
    // Release the single-flight slot so the operator can start a new run.
    (void)mark_expired(task);
  }
}

bool LifecycleController::mark_expired(const Task *task) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!active_ || task_.get() != task) {
    return false;
  }
  active_ = false;
  retired_.push_back(std::move(task_));
  return true;
}

void LifecycleController::join(Task &task) {
  if (!task.thread.joinable()) {
    return;
  }
  try {
    task.thread.join();
  } catch (const std::system_error &err) {
    std::cerr << "[monitor] join failed: " << err.what() << "\n";
  }
}

void LifecycleController::join_all(std::vector<std::unique_ptr<Task>> &tasks) {
  for (auto &task : tasks) {
    join(*task);
  }
  tasks.clear();
}

} // namespace julesbot::monitor
