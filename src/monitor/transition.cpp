#include "julesbot/monitor/transition.hpp"

namespace julesbot::monitor {

CriticalStates default_critical_states() {
  return {"AWAITING_PLAN_APPROVAL", "AWAITING_USER_FEEDBACK"};
}

NotificationDecision evaluate_transition(const std::string &session_id, const std::string &title,
                                         const std::string &current_status,
                                         const std::optional<std::string> &previous_status,
                                         const CriticalStates &critical_states) {
  NotificationDecision decision;
  if (previous_status.has_value()) {
    decision.notify = *previous_status != current_status;
  } else {
    decision.notify = critical_states.contains(current_status);
  }

  if (decision.notify) {
    decision.notification =
        Notification{.session_id = session_id, .title = title, .status = current_status};
  }
  return decision;
}

} // namespace julesbot::monitor
