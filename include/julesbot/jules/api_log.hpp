#pragma once

#include "julesbot/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

namespace julesbot::jules {

/// Append-only audit trail of raw API responses, one JSON object per line:
/// {"timestamp":"...","endpoint":"...","response":<body>}.
class ApiLog {
public:
  explicit ApiLog(std::filesystem::path path);

  [[nodiscard]] common::Status record(const std::string &endpoint, const std::string &raw_body);
  [[nodiscard]] common::Status record(const std::string &endpoint, const std::string &raw_body,
                                      std::chrono::system_clock::time_point when);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  std::mutex mutex_;
};

} // namespace julesbot::jules
