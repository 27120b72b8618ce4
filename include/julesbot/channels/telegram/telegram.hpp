#pragma once

#include "julesbot/channels/channel.hpp"
#include "julesbot/http/http_client.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace julesbot::channels::telegram {

struct TelegramOptions {
  std::string bot_token;
  std::string api_base = "https://api.telegram.org";
  std::uint64_t poll_timeout_seconds = 25;
  std::uint64_t send_timeout_ms = 15'000;
  std::chrono::milliseconds idle_sleep{150};
  std::chrono::milliseconds error_sleep{1'000};
};

/// Telegram Bot API channel: getUpdates long-polling on a worker thread and
/// sendMessage for outbound text.
class TelegramChannel final : public IChannel {
public:
  struct IncomingMessage {
    std::uint64_t update_id = 0;
    std::string message_id;
    std::string chat_id;
    std::string sender;
    std::string text;
    std::uint64_t timestamp = 0;
  };

  TelegramChannel(http::HttpClient &http, TelegramOptions options);
  ~TelegramChannel() override;

  TelegramChannel(const TelegramChannel &) = delete;
  TelegramChannel &operator=(const TelegramChannel &) = delete;

  [[nodiscard]] std::string_view name() const override { return "telegram"; }
  [[nodiscard]] common::Status start() override;
  void stop() override;
  [[nodiscard]] common::Status send(const std::string &recipient, const std::string &text,
                                    TextFormat format) override;
  void on_message(MessageCallback callback) override;
  [[nodiscard]] bool health_check() override;

  /// One getUpdates round trip; dispatches every message it receives.
  [[nodiscard]] common::Status poll_once();

  [[nodiscard]] std::uint64_t next_offset() const;

  /// Parse one element of a getUpdates "result" array.
  [[nodiscard]] static common::Result<IncomingMessage> parse_update(const std::string &update_json);

private:
  void run_loop();
  [[nodiscard]] common::Status dispatch_updates(const std::string &response_body);
  [[nodiscard]] static common::Status check_api_response(const http::HttpResponse &response,
                                                         std::string_view operation);

  http::HttpClient &http_;
  TelegramOptions options_;
  std::string base_url_;
  std::atomic<bool> running_{false};
  std::atomic<bool> healthy_{true};
  std::thread worker_;

  mutable std::mutex mutex_;
  MessageCallback callback_;
  std::uint64_t next_offset_ = 0;
};

} // namespace julesbot::channels::telegram
