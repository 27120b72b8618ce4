#include "julesbot/monitor/monitor_loop.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/observability/global.hpp"

#include <algorithm>

namespace julesbot::monitor {

namespace {

constexpr const char *UNKNOWN_STATUS = "UNKNOWN";
constexpr const char *UNTITLED = "No Title";

} // namespace

MonitorLoop::MonitorLoop(jules::ISessionApi &source, INotifier &notifier,
                         SessionStateStore &store, MonitorOptions options)
    : source_(source), notifier_(notifier), store_(store), options_(std::move(options)) {}

PollReport MonitorLoop::poll_once() { return poll(nullptr); }

PollReport MonitorLoop::poll(const StopSignal *signal) {
  ++iterations_;
  PollReport report;

  const auto sessions = source_.list_sessions(options_.page_size);
  if (!sessions.ok()) {
    report.fetch_ok = false;
    report.error = sessions.error();
    observability::record_error("monitor", "fetch failed: " + sessions.error());
    observability::record_poll_cycle(iterations_, false, 0, 0);
    return report;
  }

  // Stopped while the fetch was in flight: record nothing, so the next run
  // still reports these changes.
  if (signal != nullptr && signal->stop_requested()) {
    return report;
  }

  for (const auto &session : sessions.value()) {
    if (common::trim(session.id).empty()) {
      continue;
    }
    const std::string status = session.state.empty() ? UNKNOWN_STATUS : session.state;
    const std::string title = session.title.empty() ? UNTITLED : session.title;
    observability::record_session_observed(session.id, title, status);

    const auto decision = evaluate_transition(session.id, title, status, store_.get(session.id),
                                              options_.critical_states);
    if (decision.notify) {
      report.notifications.push_back(decision.notification);
    }
    store_.record(session.id, status);
    ++report.sessions_seen;
  }

  if (!report.notifications.empty()) {
    const auto sent = notifier_.send_digest(report.notifications);
    report.delivered = sent.ok();
    if (!sent.ok()) {
      observability::record_error("monitor", "digest delivery failed: " + sent.error());
    }
    observability::record_digest_delivered(report.notifications.size(), report.delivered);
  }

  observability::record_tracked_sessions(store_.size());
  observability::record_poll_cycle(iterations_, true, report.sessions_seen,
                                   report.notifications.size());
  return report;
}

LoopOutcome MonitorLoop::run(StopSignal &signal, const ExpiryHook &on_expired) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + options_.duration;
  observability::record_monitor_started(options_.interval, options_.duration);

  while (!signal.stop_requested() && Clock::now() < deadline) {
    try {
      (void)poll(&signal);
    } catch (const std::exception &err) {
      observability::record_error("monitor", std::string("poll cycle failed: ") + err.what());
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    if (signal.wait_for(std::min(options_.interval, remaining))) {
      break;
    }
  }

  if (signal.stop_requested()) {
    observability::record_monitor_finished(observability::FinishReason::Stopped, iterations_);
    return LoopOutcome::Stopped;
  }

  if (!on_expired || on_expired()) {
    if (auto sent = notifier_.send_finished(); !sent.ok()) {
      observability::record_error("monitor", "finished notice failed: " + sent.error());
    }
  }
  observability::record_monitor_finished(observability::FinishReason::Expired, iterations_);
  return LoopOutcome::Expired;
}

} // namespace julesbot::monitor
