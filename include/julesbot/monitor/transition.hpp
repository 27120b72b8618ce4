#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace julesbot::monitor {

using CriticalStates = std::unordered_set<std::string>;

[[nodiscard]] CriticalStates default_critical_states();

struct Notification {
  std::string session_id;
  std::string title;
  std::string status;

  bool operator==(const Notification &) const = default;
};

struct NotificationDecision {
  bool notify = false;
  Notification notification; // filled only when notify is true
};

/// Decide whether a session observation is worth reporting.
///
/// A session seen for the first time is reported only when its status is in
/// the critical set. A session seen before is reported whenever its status
/// differs from the previous one, critical or not. The function never touches
/// the state store; the caller records the current status afterwards.
[[nodiscard]] NotificationDecision evaluate_transition(const std::string &session_id,
                                                       const std::string &title,
                                                       const std::string &current_status,
                                                       const std::optional<std::string> &previous_status,
                                                       const CriticalStates &critical_states);

} // namespace julesbot::monitor
