#pragma once

#include "julesbot/common/result.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace julesbot::channels {

enum class TextFormat { Plain, Html };

struct ChannelMessage {
  std::string id;
  std::string sender;
  std::string chat_id; // reply destination
  std::string text;
  std::uint64_t timestamp = 0;
};

using MessageCallback = std::function<void(const ChannelMessage &)>;

class IChannel {
public:
  virtual ~IChannel() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status start() = 0;
  virtual void stop() = 0;
  [[nodiscard]] virtual common::Status send(const std::string &recipient, const std::string &text,
                                            TextFormat format) = 0;
  virtual void on_message(MessageCallback callback) = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace julesbot::channels
