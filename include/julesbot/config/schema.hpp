#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace julesbot::config {

struct TelegramConfig {
  std::string bot_token;
  std::string admin_chat_id;
  std::uint32_t poll_timeout_seconds = 25;
};

struct JulesConfig {
  std::string api_key;
  std::string base_url = "https://jules.googleapis.com/v1alpha";
  std::string api_log_path = "jules_api.log";
  std::uint32_t read_timeout_ms = 10'000;
  std::uint32_t create_timeout_ms = 30'000;
  std::string default_branch = "main";
};

struct MonitorConfig {
  std::uint32_t interval_seconds = 60;
  std::uint32_t duration_minutes = 60;
  std::uint32_t page_size = 10;
  std::vector<std::string> critical_states = {"AWAITING_PLAN_APPROVAL",
                                              "AWAITING_USER_FEEDBACK"};
};

struct LogConfig {
  std::string level = "info";
};

struct Config {
  TelegramConfig telegram;
  JulesConfig jules;
  MonitorConfig monitor;
  LogConfig log;
};

} // namespace julesbot::config
