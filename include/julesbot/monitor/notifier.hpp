#pragma once

#include "julesbot/channels/channel.hpp"
#include "julesbot/common/result.hpp"
#include "julesbot/monitor/transition.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace julesbot::monitor {

/// Telegram rejects sendMessage text longer than this.
constexpr std::size_t DIGEST_TEXT_LIMIT = 4096;
/// Longer titles are cut (before HTML escaping) and end in "...".
constexpr std::size_t DIGEST_TITLE_LIMIT = 200;

/// Delivery side of the monitor: everything goes to one fixed destination.
class INotifier {
public:
  virtual ~INotifier() = default;

  [[nodiscard]] virtual common::Status send_digest(const std::vector<Notification> &updates) = 0;
  [[nodiscard]] virtual common::Status send_finished() = 0;
};

class ChannelNotifier final : public INotifier {
public:
  ChannelNotifier(channels::IChannel &channel, std::string destination,
                  std::chrono::milliseconds duration);

  [[nodiscard]] common::Status send_digest(const std::vector<Notification> &updates) override;
  [[nodiscard]] common::Status send_finished() override;

private:
  channels::IChannel &channel_;
  std::string destination_;
  std::chrono::milliseconds duration_;
};

/// "Session: <title> (<code>id</code>)\nStatus: <b>STATE</b>"
[[nodiscard]] std::string format_notification(const Notification &notification);

/// "<b>Updates:</b>" followed by one entry per line. Entries that would push
/// the text past DIGEST_TEXT_LIMIT are dropped whole and counted in a
/// trailing "... and N more" line.
[[nodiscard]] std::string format_digest(const std::vector<Notification> &updates);

/// "Monitoring finished (1 hour completed)."
[[nodiscard]] std::string format_finished(std::chrono::milliseconds duration);

/// "1 hour", "30 minutes", "45 seconds".
[[nodiscard]] std::string describe_span(std::chrono::milliseconds span);

/// "every minute", "every 5 minutes", "every 30 seconds".
[[nodiscard]] std::string describe_interval(std::chrono::milliseconds interval);

} // namespace julesbot::monitor
