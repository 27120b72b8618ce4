#include "julesbot/monitor/notifier.hpp"

#include "julesbot/channels/html.hpp"

namespace julesbot::monitor {

namespace {

std::string plural(const long long count, const std::string &unit) {
  return std::to_string(count) + " " + unit + (count == 1 ? "" : "s");
}

// Ids and states are short in practice; the cap only bounds the entry size.
constexpr std::size_t FIELD_LIMIT = 128;

std::string clip(const std::string &text, const std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  std::size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut) + "...";
}

std::string more_line(const std::size_t omitted) {
  return "\n... and " + std::to_string(omitted) + " more";
}

} // namespace

ChannelNotifier::ChannelNotifier(channels::IChannel &channel, std::string destination,
                                 const std::chrono::milliseconds duration)
    : channel_(channel), destination_(std::move(destination)), duration_(duration) {}

common::Status ChannelNotifier::send_digest(const std::vector<Notification> &updates) {
  if (updates.empty()) {
    return common::Status::success();
  }
  return channel_.send(destination_, format_digest(updates), channels::TextFormat::Html);
}

common::Status ChannelNotifier::send_finished() {
  return channel_.send(destination_, format_finished(duration_), channels::TextFormat::Plain);
}

std::string format_notification(const Notification &notification) {
  return "Session: " + channels::html::escape(clip(notification.title, DIGEST_TITLE_LIMIT)) +
         " (" + channels::html::code(clip(notification.session_id, FIELD_LIMIT)) +
         ")\nStatus: " + channels::html::bold(clip(notification.status, FIELD_LIMIT));
}

std::string format_digest(const std::vector<Notification> &updates) {
  std::string text = channels::html::bold("Updates:");
  for (std::size_t i = 0; i < updates.size(); ++i) {
    const std::string entry = "\n" + format_notification(updates[i]);
    const std::size_t rest = updates.size() - i - 1;
    // Leave room for the overflow line unless this is the last entry.
    const std::size_t reserve = rest == 0 ? 0 : more_line(rest).size();
    if (text.size() + entry.size() + reserve > DIGEST_TEXT_LIMIT) {
      return text + more_line(updates.size() - i);
    }
    text += entry;
  }
  return text;
}

std::string format_finished(const std::chrono::milliseconds duration) {
  return "Monitoring finished (" + describe_span(duration) + " completed).";
}

std::string describe_span(const std::chrono::milliseconds span) {
  const long long ms = span.count();
  if (ms > 0 && ms % 3'600'000 == 0) {
    return plural(ms / 3'600'000, "hour");
  }
  if (ms > 0 && ms % 60'000 == 0) {
    return plural(ms / 60'000, "minute");
  }
  if (ms > 0 && ms % 1'000 == 0) {
    return plural(ms / 1'000, "second");
  }
  return plural(ms, "millisecond");
}

std::string describe_interval(const std::chrono::milliseconds interval) {
  const std::string span = describe_span(interval);
  if (span.rfind("1 ", 0) == 0) {
    return "every " + span.substr(2);
  }
  return "every " + span;
}

} // namespace julesbot::monitor
