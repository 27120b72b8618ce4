#include "julesbot/bot/format.hpp"

#include "julesbot/channels/html.hpp"
#include "julesbot/common/fs.hpp"
#include "julesbot/jules/jules_client.hpp"
#include "julesbot/monitor/notifier.hpp"

namespace julesbot::bot {

namespace {

namespace html = channels::html;

std::string or_default(const std::string &value, const std::string &fallback) {
  return value.empty() ? fallback : value;
}

// "1 hour" -> "hour", so the sentence reads "for the next hour".
std::string next_span(const std::chrono::milliseconds span) {
  const std::string text = monitor::describe_span(span);
  return common::starts_with(text, "1 ") ? text.substr(2) : text;
}

} // namespace

std::string format_help(const std::chrono::milliseconds monitor_duration) {
  return "Hello! I am the Jules Monitoring Bot.\n"
         "Commands:\n"
         "/list - List recent sessions\n"
         "/monitor - Start monitoring sessions for " +
         monitor::describe_span(monitor_duration) +
         " (send again to stop)\n"
         "/create <owner/repo> <prompt> - Create a new session\n"
         "/info <session_id> - Show session details";
}

std::string format_session_list(const std::vector<jules::Session> &sessions) {
  std::string text = html::bold("Recent Sessions:");
  for (const auto &session : sessions) {
    text += "\n🆔 " + html::code(or_default(session.id, "Unknown ID")) +
            "\nTitle: " + html::escape(or_default(session.title, "No Title")) + "\n";
  }
  return text;
}

std::string format_session_info(const jules::Session &session) {
  const std::string clean_id = jules::clean_session_id(session.id);
  const std::string url =
      session.url.empty() ? jules::default_session_url(clean_id) : session.url;
  return "🆔 ID: " + html::code(clean_id) + "\n📌 Title: " +
         html::escape(or_default(session.title, "No Title")) + "\n📊 State: " +
         html::escape(or_default(session.state, "Unknown State")) + "\n🔗 URL: " +
         html::escape(url) + "\n\nActivities: /list_activities_" + clean_id;
}

std::string format_activities(const std::string &session_id,
                              const std::vector<jules::Activity> &activities) {
  std::string text = html::bold("Activities for " + session_id + ":");
  for (const auto &activity : activities) {
    text += "\n• " + html::code(or_default(activity.type, "Unknown")) + " at " +
            html::escape(activity.create_time);
  }
  return truncate_message(text, ACTIVITY_TEXT_LIMIT);
}

std::string format_created(const jules::CreatedSession &created) {
  return "✅ Session Created!\n🆔 ID: " + html::code(created.id) + "\n🔗 URL: " +
         html::escape(created.url) + "\n📊 State: " +
         html::escape(or_default(created.state, "Unknown State"));
}

std::string format_monitor_started(const std::chrono::milliseconds interval,
                                   const std::chrono::milliseconds duration) {
  return "Monitoring started. I will check for changes " + monitor::describe_interval(interval) +
         " for the next " + next_span(duration) + ".";
}

std::string truncate_message(const std::string &text, const std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  std::size_t cut = text.rfind('\n', limit);
  if (cut == std::string::npos || cut == 0) {
    cut = limit;
    // Step back over UTF-8 continuation bytes.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
      --cut;
    }
  }
  return text.substr(0, cut) + "...";
}

} // namespace julesbot::bot
