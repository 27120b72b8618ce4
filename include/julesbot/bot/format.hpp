#pragma once

#include "julesbot/jules/session_api.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace julesbot::bot {

inline constexpr std::size_t ACTIVITY_TEXT_LIMIT = 4000;

[[nodiscard]] std::string format_help(std::chrono::milliseconds monitor_duration);
[[nodiscard]] std::string format_session_list(const std::vector<jules::Session> &sessions);
[[nodiscard]] std::string format_session_info(const jules::Session &session);
[[nodiscard]] std::string format_activities(const std::string &session_id,
                                            const std::vector<jules::Activity> &activities);
[[nodiscard]] std::string format_created(const jules::CreatedSession &created);
[[nodiscard]] std::string format_monitor_started(std::chrono::milliseconds interval,
                                                 std::chrono::milliseconds duration);

/// Cut text to at most limit bytes plus "...". The cut lands on a line break
/// when one exists, so HTML spans are not split; otherwise it lands on a
/// UTF-8 boundary.
[[nodiscard]] std::string truncate_message(const std::string &text, std::size_t limit);

} // namespace julesbot::bot
