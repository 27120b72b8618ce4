#include "julesbot/observability/global.hpp"

#include <mutex>

namespace julesbot::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

std::string_view to_string(const FinishReason reason) {
  return reason == FinishReason::Expired ? "expired" : "stopped";
}

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_monitor_started(const std::chrono::milliseconds interval,
                            const std::chrono::milliseconds duration) {
  record_event(MonitorStartedEvent{.interval = interval, .duration = duration});
}

void record_poll_cycle(const std::uint64_t iteration, const bool fetch_ok,
                       const std::size_t sessions_seen, const std::size_t notifications) {
  record_event(PollCycleEvent{.iteration = iteration,
                              .fetch_ok = fetch_ok,
                              .sessions_seen = sessions_seen,
                              .notifications = notifications});
}

void record_session_observed(const std::string &id, const std::string &title,
                             const std::string &status) {
  record_event(SessionObservedEvent{.id = id, .title = title, .status = status});
}

void record_digest_delivered(const std::size_t notifications, const bool delivered) {
  record_event(DigestDeliveredEvent{.notifications = notifications, .delivered = delivered});
}

void record_monitor_finished(const FinishReason reason, const std::uint64_t iterations) {
  record_event(MonitorFinishedEvent{.reason = reason, .iterations = iterations});
}

void record_command_handled(const std::string &command, const std::string &chat_id,
                            const bool authorized) {
  record_event(
      CommandHandledEvent{.command = command, .chat_id = chat_id, .authorized = authorized});
}

void record_api_latency(const std::string &endpoint, const std::chrono::milliseconds latency) {
  record_metric(ApiLatencyMetric{.endpoint = endpoint, .latency = latency});
}

void record_tracked_sessions(const std::uint64_t count) {
  record_metric(TrackedSessionsMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace julesbot::observability
