#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace julesbot::observability {

struct MonitorStartedEvent {
  std::chrono::milliseconds interval{0};
  std::chrono::milliseconds duration{0};
};

struct PollCycleEvent {
  std::uint64_t iteration = 0;
  bool fetch_ok = true;
  std::size_t sessions_seen = 0;
  std::size_t notifications = 0;
};

struct SessionObservedEvent {
  std::string id;
  std::string title;
  std::string status;
};

struct DigestDeliveredEvent {
  std::size_t notifications = 0;
  bool delivered = false;
};

enum class FinishReason { Expired, Stopped };

struct MonitorFinishedEvent {
  FinishReason reason = FinishReason::Expired;
  std::uint64_t iterations = 0;
};

struct CommandHandledEvent {
  std::string command;
  std::string chat_id;
  bool authorized = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<MonitorStartedEvent, PollCycleEvent, SessionObservedEvent, DigestDeliveredEvent,
                 MonitorFinishedEvent, CommandHandledEvent, ErrorEvent>;

struct ApiLatencyMetric {
  std::string endpoint;
  std::chrono::milliseconds latency{0};
};

struct TrackedSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ApiLatencyMetric, TrackedSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string_view to_string(FinishReason reason);

} // namespace julesbot::observability
