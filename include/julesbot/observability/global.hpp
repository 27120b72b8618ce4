#pragma once

#include "julesbot/observability/observer.hpp"

#include <memory>

namespace julesbot::observability {

/// Install the process-wide observer. Passing nullptr turns every record_*
/// call into a no-op.
void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_monitor_started(std::chrono::milliseconds interval, std::chrono::milliseconds duration);
void record_poll_cycle(std::uint64_t iteration, bool fetch_ok, std::size_t sessions_seen,
                       std::size_t notifications);
void record_session_observed(const std::string &id, const std::string &title,
                             const std::string &status);
void record_digest_delivered(std::size_t notifications, bool delivered);
void record_monitor_finished(FinishReason reason, std::uint64_t iterations);
void record_command_handled(const std::string &command, const std::string &chat_id,
                            bool authorized);
void record_api_latency(const std::string &endpoint, std::chrono::milliseconds latency);
void record_tracked_sessions(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace julesbot::observability
