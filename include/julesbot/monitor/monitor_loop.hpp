#pragma once

#include "julesbot/jules/session_api.hpp"
#include "julesbot/monitor/notifier.hpp"
#include "julesbot/monitor/state_store.hpp"
#include "julesbot/monitor/stop_signal.hpp"
#include "julesbot/monitor/transition.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace julesbot::monitor {

struct MonitorOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds duration{std::chrono::hours(1)};
  std::uint32_t page_size = 10;
  CriticalStates critical_states = default_critical_states();
};

struct PollReport {
  bool fetch_ok = true;
  std::string error;
  std::size_t sessions_seen = 0;
  std::vector<Notification> notifications;
  bool delivered = false;
};

enum class LoopOutcome { Expired, Stopped };

/// Called once when the time budget runs out. Returning false suppresses the
/// "finished" notice (the run was already stopped from outside).
using ExpiryHook = std::function<bool()>;

/// One time-bounded monitoring run. It polls the session source, diffs each
/// session against the store and sends one digest per cycle with changes.
class MonitorLoop {
public:
  MonitorLoop(jules::ISessionApi &source, INotifier &notifier, SessionStateStore &store,
              MonitorOptions options);

  /// Single fetch-evaluate-notify pass. Fetch failures are reported in the
  /// result, never thrown.
  [[nodiscard]] PollReport poll_once();

  /// Poll until the deadline passes or the signal fires.
  [[nodiscard]] LoopOutcome run(StopSignal &signal, const ExpiryHook &on_expired = {});

  [[nodiscard]] std::uint64_t iterations() const { return iterations_; }

private:
  PollReport poll(const StopSignal *signal);

  jules::ISessionApi &source_;
  INotifier &notifier_;
  SessionStateStore &store_;
  MonitorOptions options_;
  std::uint64_t iterations_ = 0;
};

} // namespace julesbot::monitor
