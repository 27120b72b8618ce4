#pragma once

#include "julesbot/bot/command_router.hpp"
#include "julesbot/jules/session_api.hpp"
#include "julesbot/monitor/lifecycle.hpp"

#include <cstdint>
#include <string>

namespace julesbot::bot {

struct BotCommandOptions {
  std::string default_branch = "main";
  std::uint32_t list_page_size = 10;
  std::uint32_t activities_page_size = 10;
};

/// Handlers behind the operator command surface.
class BotCommands {
public:
  BotCommands(jules::ISessionApi &api, monitor::LifecycleController &controller,
              BotCommandOptions options = {});

  /// Register every command on the router.
  void install(CommandRouter &router);

  [[nodiscard]] CommandResponse start(const CommandRequest &request) const;
  [[nodiscard]] CommandResponse list(const CommandRequest &request) const;
  [[nodiscard]] CommandResponse toggle_monitor(const CommandRequest &request) const;
  [[nodiscard]] CommandResponse create(const CommandRequest &request) const;
  [[nodiscard]] CommandResponse info(const CommandRequest &request) const;
  [[nodiscard]] CommandResponse activities(const CommandRequest &request) const;

private:
  [[nodiscard]] CommandResponse session_info(const std::string &session_id) const;

  jules::ISessionApi &api_;
  monitor::LifecycleController &controller_;
  BotCommandOptions options_;
};

} // namespace julesbot::bot
