#pragma once

#include "julesbot/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace julesbot::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(const std::string &name);

/// Writes one "[LEVEL] message" line per event. Lines below min_level are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace julesbot::observability
