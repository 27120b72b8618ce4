#include "julesbot/monitor/state_store.hpp"

namespace julesbot::monitor {

std::optional<std::string> SessionStateStore::get(const std::string &session_id) const {
  if (const auto it = states_.find(session_id); it != states_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void SessionStateStore::record(const std::string &session_id, const std::string &status) {
  states_[session_id] = status;
}

} // namespace julesbot::monitor
