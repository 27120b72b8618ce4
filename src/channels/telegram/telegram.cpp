#include "julesbot/channels/telegram/telegram.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/common/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <sstream>
#include <system_error>

namespace julesbot::channels::telegram {

namespace {

constexpr std::size_t ERROR_BODY_LIMIT = 240;

std::uint64_t parse_u64(const std::string &raw) {
  std::uint64_t value = 0;
  const char *first = raw.data();
  const char *last = first + raw.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return 0;
  }
  return value;
}

std::string field_of(const common::JsonFlatMap &fields, const char *key) {
  const auto it = fields.find(key);
  return it == fields.end() ? "" : it->second;
}

} // namespace

TelegramChannel::TelegramChannel(http::HttpClient &http, TelegramOptions options)
    : http_(http), options_(std::move(options)) {
  base_url_ = options_.api_base + "/bot" + common::trim(options_.bot_token);
}

TelegramChannel::~TelegramChannel() { stop(); }

common::Status TelegramChannel::start() {
  if (running_.load()) {
    return common::Status::success();
  }
  if (common::trim(options_.bot_token).empty()) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "telegram bot_token is required");
  }
  healthy_.store(true);
  running_.store(true);
  worker_ = std::thread([this]() { run_loop(); });
  return common::Status::success();
}

void TelegramChannel::stop() {
  running_.store(false);
  if (worker_.joinable()) {
    try {
      worker_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[telegram] join failed: " << err.what() << "\n";
    }
  }
}

common::Status TelegramChannel::send(const std::string &recipient, const std::string &text,
                                     const TextFormat format) {
  const std::string chat_id = common::trim(recipient);
  if (chat_id.empty()) {
    return common::Status::error("recipient is required");
  }
  if (common::trim(text).empty()) {
    return common::Status::error("text is required");
  }

  std::ostringstream body;
  body << "{\"chat_id\":\"" << common::json_escape(chat_id) << "\",";
  body << "\"text\":\"" << common::json_escape(text) << "\"";
  if (format == TextFormat::Html) {
    body << ",\"parse_mode\":\"HTML\"";
  }
  body << "}";

  const auto response = http_.post_json(base_url_ + "/sendMessage",
                                        {{"Content-Type", "application/json"}}, body.str(),
                                        options_.send_timeout_ms);
  return check_api_response(response, "sendMessage");
}

void TelegramChannel::on_message(MessageCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

bool TelegramChannel::health_check() { return !running_.load() || healthy_.load(); }

std::uint64_t TelegramChannel::next_offset() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_offset_;
}

void TelegramChannel::run_loop() {
  while (running_.load()) {
    const auto status = poll_once();
    if (!status.ok()) {
      healthy_.store(false);
      std::cerr << "[telegram] poll error: " << status.error() << "\n";
      std::this_thread::sleep_for(options_.error_sleep);
    } else {
      healthy_.store(true);
      std::this_thread::sleep_for(options_.idle_sleep);
    }
  }
}

common::Status TelegramChannel::poll_once() {
  const std::uint64_t offset = next_offset();

  std::ostringstream body;
  body << "{\"offset\":" << offset << ",";
  body << "\"timeout\":" << options_.poll_timeout_seconds << ",";
  body << "\"allowed_updates\":[\"message\"]}";

  const auto response =
      http_.post_json(base_url_ + "/getUpdates", {{"Content-Type", "application/json"}},
                      body.str(), (options_.poll_timeout_seconds + 5) * 1000);
  if (auto status = check_api_response(response, "getUpdates"); !status.ok()) {
    return status;
  }
  return dispatch_updates(response.body);
}

common::Result<TelegramChannel::IncomingMessage>
TelegramChannel::parse_update(const std::string &update_json) {
  const auto update = common::json_parse_flat(update_json);
  IncomingMessage message;
  message.update_id = parse_u64(field_of(update, "update_id"));
  if (message.update_id == 0) {
    return common::Result<IncomingMessage>::failure(common::ErrorKind::MalformedInput,
                                                    "missing update_id");
  }

  const std::string message_obj = field_of(update, "message");
  if (message_obj.empty() || message_obj.front() != '{') {
    return common::Result<IncomingMessage>::failure(common::ErrorKind::MalformedInput,
                                                    "update has no message");
  }
  const auto fields = common::json_parse_flat(message_obj);
  message.message_id = field_of(fields, "message_id");
  message.text = field_of(fields, "text");
  message.timestamp = parse_u64(field_of(fields, "date"));

  const auto chat = common::json_parse_flat(field_of(fields, "chat"));
  message.chat_id = field_of(chat, "id");
  if (message.chat_id.empty()) {
    return common::Result<IncomingMessage>::failure(common::ErrorKind::MalformedInput,
                                                    "message chat id missing");
  }

  const auto from = common::json_parse_flat(field_of(fields, "from"));
  message.sender = field_of(from, "username");
  if (message.sender.empty()) {
    message.sender = field_of(from, "id");
  }
  return common::Result<IncomingMessage>::success(std::move(message));
}

common::Status TelegramChannel::dispatch_updates(const std::string &response_body) {
  const std::string result_array = common::json_get_array(response_body, "result");
  if (result_array.empty()) {
    return common::Status::error("getUpdates response missing result array");
  }

  const auto updates = common::json_split_top_level_objects(result_array);
  std::uint64_t max_seen_update = 0;
  for (const auto &update_json : updates) {
    // The offset must move past malformed updates too, or they come back forever.
    max_seen_update = std::max(
        max_seen_update, parse_u64(field_of(common::json_parse_flat(update_json), "update_id")));

    const auto parsed = parse_update(update_json);
    if (!parsed.ok()) {
      std::cerr << "[telegram] skip update: " << parsed.error() << "\n";
      continue;
    }
    const auto &incoming = parsed.value();
    if (common::trim(incoming.text).empty()) {
      continue;
    }

    MessageCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback = callback_;
    }
    if (!callback) {
      std::cerr << "[telegram] no handler for update_id=" << incoming.update_id << "\n";
      continue;
    }

    ChannelMessage message;
    message.id = incoming.message_id.empty() ? std::to_string(incoming.update_id)
                                             : incoming.message_id;
    message.sender = incoming.sender;
    message.chat_id = incoming.chat_id;
    message.text = incoming.text;
    message.timestamp = incoming.timestamp;
    callback(message);
  }

  if (max_seen_update > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    next_offset_ = std::max(next_offset_, max_seen_update + 1);
  }
  return common::Status::success();
}

common::Status TelegramChannel::check_api_response(const http::HttpResponse &response,
                                                   const std::string_view operation) {
  if (response.timeout) {
    return common::Status::error(std::string(operation) + " timeout");
  }
  if (response.network_error) {
    return common::Status::error(std::string(operation) +
                                 " network error: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string snippet = common::trim(response.body);
    if (snippet.size() > ERROR_BODY_LIMIT) {
      snippet.resize(ERROR_BODY_LIMIT);
    }
    return common::Status::error(std::string(operation) + " failed status=" +
                                 std::to_string(response.status) + " body=" + snippet);
  }
  if (!common::json_get_bool(response.body, "ok")) {
    return common::Status::error(std::string(operation) + " response missing ok=true");
  }
  return common::Status::success();
}

} // namespace julesbot::channels::telegram
