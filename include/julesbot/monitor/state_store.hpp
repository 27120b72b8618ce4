#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace julesbot::monitor {

/// Last observed status per session id. Entries are never removed, so a
/// session that drops out of the feed keeps its last status. Only the single
/// active monitoring loop writes to it.
class SessionStateStore {
public:
  [[nodiscard]] std::optional<std::string> get(const std::string &session_id) const;
  void record(const std::string &session_id, const std::string &status);
  [[nodiscard]] std::size_t size() const { return states_.size(); }
  [[nodiscard]] bool contains(const std::string &session_id) const {
    return states_.contains(session_id);
  }

private:
  std::unordered_map<std::string, std::string> states_;
};

} // namespace julesbot::monitor
