#include "julesbot/bot/commands.hpp"

#include "julesbot/bot/format.hpp"
#include "julesbot/common/fs.hpp"

namespace julesbot::bot {

namespace {

using channels::TextFormat;

CommandResponse single(std::string text, const TextFormat format = TextFormat::Plain) {
  CommandResponse response;
  response.add(std::move(text), format);
  return response;
}

} // namespace

BotCommands::BotCommands(jules::ISessionApi &api, monitor::LifecycleController &controller,
                         BotCommandOptions options)
    : api_(api), controller_(controller), options_(std::move(options)) {}

void BotCommands::install(CommandRouter &router) {
  router.add_command(
      "/start", [this](const CommandRequest &request) { return start(request); }, false);
  router.add_command("/list", [this](const CommandRequest &request) { return list(request); });
  router.add_command("/monitor",
                     [this](const CommandRequest &request) { return toggle_monitor(request); });
  router.add_command("/create",
                     [this](const CommandRequest &request) { return create(request); });
  router.add_command("/info", [this](const CommandRequest &request) { return info(request); });
  router.add_pattern("/info_(\\d+)",
                     [this](const CommandRequest &request) { return info(request); });
  router.add_pattern("/list_activities_(\\d+)",
                     [this](const CommandRequest &request) { return activities(request); });
}

CommandResponse BotCommands::start(const CommandRequest &) const {
  return single(format_help(controller_.options().duration));
}

CommandResponse BotCommands::list(const CommandRequest &) const {
  const auto sessions = api_.list_sessions(options_.list_page_size);
  if (!sessions.ok()) {
    return single("Failed to fetch sessions. Check logs.");
  }
  if (sessions.value().empty()) {
    return single("No sessions found.");
  }
  return single(format_session_list(sessions.value()), TextFormat::Html);
}

CommandResponse BotCommands::toggle_monitor(const CommandRequest &) const {
  if (controller_.toggle() == monitor::ToggleResult::Stopped) {
    return single("Monitoring stopped.");
  }
  const auto &monitor_options = controller_.options();
  return single(format_monitor_started(monitor_options.interval, monitor_options.duration));
}

CommandResponse BotCommands::create(const CommandRequest &request) const {
  const auto args = common::split_words(request.args, 1);
  if (args.size() < 2) {
    return single("Usage: /create <owner/repo> <prompt>");
  }

  const std::string &repo_arg = args[0];
  const auto slash = repo_arg.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == repo_arg.size()) {
    return single("Invalid repo format. Use owner/repo (e.g., Montelibero/docker-helper)");
  }

  const auto created = api_.create_session(repo_arg.substr(0, slash), repo_arg.substr(slash + 1),
                                           args[1], options_.default_branch);
  if (!created.ok()) {
    return single("Failed to create session. Check logs.");
  }
  return single(format_created(created.value()), TextFormat::Html);
}

CommandResponse BotCommands::info(const CommandRequest &request) const {
  if (!request.captures.empty()) {
    return session_info(request.captures.front());
  }
  const std::string session_id = common::trim(request.args);
  if (session_id.empty()) {
    return single("Usage: /info <session_id>");
  }
  return session_info(session_id);
}

CommandResponse BotCommands::session_info(const std::string &session_id) const {
  const auto session = api_.get_session(session_id);
  if (!session.ok()) {
    return single("❌ Session " + session_id + " not found or error occurred.");
  }
  return single(format_session_info(session.value()), TextFormat::Html);
}

CommandResponse BotCommands::activities(const CommandRequest &request) const {
  if (request.captures.empty()) {
    return single(UNKNOWN_COMMAND_REPLY);
  }
  const std::string &session_id = request.captures.front();
  const auto activities = api_.list_activities(session_id, options_.activities_page_size);
  if (!activities.ok()) {
    return single("Failed to fetch activities for session " + session_id + ". Check logs.");
  }
  if (activities.value().empty()) {
    return single("No activities found.");
  }
  return single(format_activities(session_id, activities.value()), TextFormat::Html);
}

} // namespace julesbot::bot
