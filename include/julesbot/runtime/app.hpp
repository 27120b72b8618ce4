#pragma once

#include "julesbot/bot/command_router.hpp"
#include "julesbot/bot/commands.hpp"
#include "julesbot/channels/telegram/telegram.hpp"
#include "julesbot/common/result.hpp"
#include "julesbot/config/schema.hpp"
#include "julesbot/http/http_client.hpp"
#include "julesbot/jules/jules_client.hpp"
#include "julesbot/monitor/lifecycle.hpp"
#include "julesbot/monitor/notifier.hpp"

#include <atomic>
#include <memory>

namespace julesbot::runtime {

[[nodiscard]] monitor::MonitorOptions monitor_options_from(const config::Config &config);

/// Wires the bot together: Jules client, Telegram channel, monitor
/// controller and command router.
class Application {
public:
  explicit Application(config::Config config,
                       std::shared_ptr<http::HttpClient> http = std::make_shared<http::CurlHttpClient>());
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  /// Start the chat channel and route inbound messages to the commands.
  [[nodiscard]] common::Status start();

  /// Block until SIGINT or SIGTERM, then shut down.
  [[nodiscard]] common::Status run();

  /// Stop an active monitoring run (no "finished" notice) and the channel.
  void shutdown();

  /// Route one inbound chat message and send the replies back to its chat.
  void handle_message(const channels::ChannelMessage &message);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] monitor::LifecycleController &controller() { return controller_; }

private:
  config::Config config_;
  std::shared_ptr<http::HttpClient> http_;
  jules::JulesClient jules_;
  channels::telegram::TelegramChannel channel_;
  monitor::ChannelNotifier notifier_;
  monitor::LifecycleController controller_;
  bot::BotCommands commands_;
  bot::CommandRouter router_;
  std::atomic<bool> started_{false};
};

} // namespace julesbot::runtime
