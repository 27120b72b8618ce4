#pragma once

#include "julesbot/channels/channel.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace julesbot::bot {

struct Reply {
  std::string text;
  channels::TextFormat format = channels::TextFormat::Plain;
};

struct CommandRequest {
  std::string chat_id;
  std::string command;               // "/info", without any @botname suffix
  std::string args;                  // text after the command word, trimmed
  std::string raw;                   // full message text
  std::vector<std::string> captures; // regex groups for pattern routes
};

struct CommandResponse {
  std::vector<Reply> replies;

  void add(std::string text, channels::TextFormat format = channels::TextFormat::Plain) {
    replies.push_back(Reply{.text = std::move(text), .format = format});
  }
};

using CommandHandler = std::function<CommandResponse(const CommandRequest &)>;

inline constexpr const char *UNAUTHORIZED_REPLY = "Unauthorized.";
inline constexpr const char *UNKNOWN_COMMAND_REPLY = "Unknown command. Send /start for help.";
inline constexpr const char *INTERNAL_ERROR_REPLY = "Something went wrong. Check logs.";

/// Dispatch table for chat commands. Exact names are looked up first, then
/// the pattern routes in registration order. Routes flagged operator_only
/// reply "Unauthorized." to every chat except the operator's.
class CommandRouter {
public:
  explicit CommandRouter(std::string operator_chat_id);

  void add_command(const std::string &name, CommandHandler handler, bool operator_only = true);

  /// The pattern must match the whole command word, e.g. "/info_(\\d+)".
  void add_pattern(const std::string &pattern, CommandHandler handler, bool operator_only = true);

  /// Plain text (no leading '/') yields an empty response.
  [[nodiscard]] CommandResponse dispatch(const std::string &chat_id,
                                         const std::string &text) const;

  [[nodiscard]] bool is_operator(const std::string &chat_id) const;

private:
  struct Route {
    CommandHandler handler;
    bool operator_only = true;
  };

  struct PatternRoute {
    std::regex pattern;
    Route route;
  };

  [[nodiscard]] CommandResponse invoke(const Route &route, const CommandRequest &request) const;

  std::string operator_chat_id_;
  std::unordered_map<std::string, Route> commands_;
  std::vector<PatternRoute> patterns_;
};

/// "/info@jules_bot 12" -> {"/info", "12"}.
struct ParsedCommand {
  std::string command;
  std::string args;
};
[[nodiscard]] ParsedCommand parse_command(const std::string &text);

} // namespace julesbot::bot
