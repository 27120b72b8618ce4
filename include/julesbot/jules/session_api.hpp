#pragma once

#include "julesbot/common/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace julesbot::jules {

/// Snapshot of one remote session. Fields the API omitted are left empty.
struct Session {
  std::string id;
  std::string title;
  std::string state;
  std::string url;
};

struct Activity {
  std::string type;
  std::string create_time;
};

struct CreatedSession {
  std::string id;
  std::string url;
  std::string state;
};

/// Remote session source. Every call fails with ErrorKind::Fetch when the
/// remote is unreachable or answers badly; an empty list is a success.
class ISessionApi {
public:
  virtual ~ISessionApi() = default;

  [[nodiscard]] virtual common::Result<std::vector<Session>>
  list_sessions(std::uint32_t page_size) = 0;
  [[nodiscard]] virtual common::Result<Session> get_session(const std::string &session_id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Activity>>
  list_activities(const std::string &session_id, std::uint32_t page_size) = 0;
  [[nodiscard]] virtual common::Result<CreatedSession>
  create_session(const std::string &owner, const std::string &repo, const std::string &prompt,
                 const std::string &branch) = 0;
};

} // namespace julesbot::jules
