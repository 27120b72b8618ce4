#include "julesbot/observability/log_observer.hpp"

#include "julesbot/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace julesbot::observability {

namespace {

std::string_view level_tag(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level_tag(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MonitorStartedEvent>) {
          write(LogLevel::Info, "monitor.start interval_ms=" +
                                    std::to_string(evt.interval.count()) +
                                    " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, PollCycleEvent>) {
          write(evt.fetch_ok ? LogLevel::Debug : LogLevel::Warn,
                "monitor.poll iteration=" + std::to_string(evt.iteration) +
                    " fetch_ok=" + (evt.fetch_ok ? std::string("true") : std::string("false")) +
                    " sessions=" + std::to_string(evt.sessions_seen) +
                    " notifications=" + std::to_string(evt.notifications));
        } else if constexpr (std::is_same_v<T, SessionObservedEvent>) {
          write(LogLevel::Debug, "session id=" + evt.id + " status=" + evt.status +
                                     " title=" + evt.title);
        } else if constexpr (std::is_same_v<T, DigestDeliveredEvent>) {
          write(evt.delivered ? LogLevel::Info : LogLevel::Warn,
                "monitor.digest notifications=" + std::to_string(evt.notifications) +
                    " delivered=" + (evt.delivered ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, MonitorFinishedEvent>) {
          write(LogLevel::Info, "monitor.finish reason=" + std::string(to_string(evt.reason)) +
                                    " iterations=" + std::to_string(evt.iterations));
        } else if constexpr (std::is_same_v<T, CommandHandledEvent>) {
          write(evt.authorized ? LogLevel::Info : LogLevel::Warn,
                "command " + evt.command + " chat=" + evt.chat_id +
                    (evt.authorized ? "" : " rejected=unauthorized"));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ApiLatencyMetric>) {
          write(LogLevel::Debug,
                "metric.api_latency_ms endpoint=" + m.endpoint + " value=" +
                    std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TrackedSessionsMetric>) {
          write(LogLevel::Debug, "metric.tracked_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace julesbot::observability
