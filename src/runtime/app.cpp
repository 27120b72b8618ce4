#include "julesbot/runtime/app.hpp"

#include "julesbot/observability/global.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace julesbot::runtime {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

jules::JulesClientOptions jules_options_from(const config::Config &config) {
  jules::JulesClientOptions options;
  options.base_url = config.jules.base_url;
  options.api_key = config.jules.api_key;
  options.read_timeout_ms = config.jules.read_timeout_ms;
  options.create_timeout_ms = config.jules.create_timeout_ms;
  return options;
}

std::shared_ptr<jules::ApiLog> api_log_from(const config::Config &config) {
  if (config.jules.api_log_path.empty()) {
    return nullptr;
  }
  return std::make_shared<jules::ApiLog>(config.jules.api_log_path);
}

channels::telegram::TelegramOptions telegram_options_from(const config::Config &config) {
  channels::telegram::TelegramOptions options;
  options.bot_token = config.telegram.bot_token;
  options.poll_timeout_seconds = config.telegram.poll_timeout_seconds;
  return options;
}

bot::BotCommandOptions command_options_from(const config::Config &config) {
  bot::BotCommandOptions options;
  options.default_branch = config.jules.default_branch;
  options.list_page_size = config.monitor.page_size;
  return options;
}

} // namespace

monitor::MonitorOptions monitor_options_from(const config::Config &config) {
  monitor::MonitorOptions options;
  options.interval = std::chrono::seconds(config.monitor.interval_seconds);
  options.duration = std::chrono::minutes(config.monitor.duration_minutes);
  options.page_size = config.monitor.page_size;
  options.critical_states = monitor::CriticalStates(config.monitor.critical_states.begin(),
                                                    config.monitor.critical_states.end());
  return options;
}

Application::Application(config::Config config, std::shared_ptr<http::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)),
      jules_(*http_, jules_options_from(config_), api_log_from(config_)),
      channel_(*http_, telegram_options_from(config_)),
      notifier_(channel_, config_.telegram.admin_chat_id,
                std::chrono::minutes(config_.monitor.duration_minutes)),
      controller_(jules_, notifier_, monitor_options_from(config_)),
      commands_(jules_, controller_, command_options_from(config_)),
      router_(config_.telegram.admin_chat_id) {
  commands_.install(router_);
}

Application::~Application() { shutdown(); }

common::Status Application::start() {
  if (started_.exchange(true)) {
    return common::Status::success();
  }
  channel_.on_message([this](const channels::ChannelMessage &message) { handle_message(message); });
  auto status = channel_.start();
  if (!status.ok()) {
    started_.store(false);
    return status;
  }
  std::cerr << "[julesbot] listening for commands, operator chat "
            << config_.telegram.admin_chat_id << "\n";
  return common::Status::success();
}

common::Status Application::run() {
  g_stop_requested = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  if (auto status = start(); !status.ok()) {
    return status;
  }
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  std::cerr << "[julesbot] shutting down\n";
  shutdown();
  return common::Status::success();
}

void Application::shutdown() {
  controller_.shutdown();
  if (started_.exchange(false)) {
    channel_.stop();
  }
  if (auto observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

void Application::handle_message(const channels::ChannelMessage &message) {
  const auto response = router_.dispatch(message.chat_id, message.text);
  for (const auto &reply : response.replies) {
    if (auto sent = channel_.send(message.chat_id, reply.text, reply.format); !sent.ok()) {
      observability::record_error("telegram", "reply failed: " + sent.error());
    }
  }
}

} // namespace julesbot::runtime
