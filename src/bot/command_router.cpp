#include "julesbot/bot/command_router.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/observability/global.hpp"

namespace julesbot::bot {

ParsedCommand parse_command(const std::string &text) {
  const auto words = common::split_words(text, 1);
  if (words.empty()) {
    return {};
  }
  ParsedCommand parsed;
  parsed.command = words[0];
  if (const auto at = parsed.command.find('@'); at != std::string::npos) {
    parsed.command.erase(at);
  }
  if (words.size() > 1) {
    parsed.args = words[1];
  }
  return parsed;
}

CommandRouter::CommandRouter(std::string operator_chat_id)
    : operator_chat_id_(common::trim(operator_chat_id)) {}

void CommandRouter::add_command(const std::string &name, CommandHandler handler,
                                const bool operator_only) {
  commands_[name] = Route{.handler = std::move(handler), .operator_only = operator_only};
}

void CommandRouter::add_pattern(const std::string &pattern, CommandHandler handler,
                                const bool operator_only) {
  patterns_.push_back(PatternRoute{
      .pattern = std::regex(pattern),
      .route = Route{.handler = std::move(handler), .operator_only = operator_only}});
}

bool CommandRouter::is_operator(const std::string &chat_id) const {
  return !operator_chat_id_.empty() && common::trim(chat_id) == operator_chat_id_;
}

CommandResponse CommandRouter::dispatch(const std::string &chat_id,
                                        const std::string &text) const {
  const std::string trimmed = common::trim(text);
  if (trimmed.empty() || trimmed.front() != '/') {
    return {};
  }

  const auto parsed = parse_command(trimmed);
  CommandRequest request;
  request.chat_id = common::trim(chat_id);
  request.command = parsed.command;
  request.args = parsed.args;
  request.raw = trimmed;

  if (const auto it = commands_.find(parsed.command); it != commands_.end()) {
    return invoke(it->second, request);
  }

  // Pattern routes take no arguments: "/info_12 extra" is not a match.
  if (parsed.args.empty()) {
    for (const auto &entry : patterns_) {
      std::smatch match;
      if (!std::regex_match(parsed.command, match, entry.pattern)) {
        continue;
      }
      for (std::size_t i = 1; i < match.size(); ++i) {
        request.captures.push_back(match[i].str());
      }
      return invoke(entry.route, request);
    }
  }

  const bool authorized = is_operator(request.chat_id);
  observability::record_command_handled(request.command, request.chat_id, authorized);
  CommandResponse response;
  response.add(authorized ? UNKNOWN_COMMAND_REPLY : UNAUTHORIZED_REPLY);
  return response;
}

CommandResponse CommandRouter::invoke(const Route &route, const CommandRequest &request) const {
  const bool authorized = !route.operator_only || is_operator(request.chat_id);
  observability::record_command_handled(request.command, request.chat_id, authorized);
  if (!authorized) {
    CommandResponse response;
    response.add(UNAUTHORIZED_REPLY);
    return response;
  }

  try {
    return route.handler(request);
  } catch (const std::exception &err) {
    observability::record_error("command " + request.command, err.what());
    CommandResponse response;
    response.add(INTERNAL_ERROR_REPLY);
    return response;
  }
}

} // namespace julesbot::bot
