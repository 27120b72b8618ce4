#include "julesbot/jules/api_log.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/common/json_util.hpp"

#include <algorithm>

namespace julesbot::jules {

namespace {

// Raw newlines in a JSON document are insignificant whitespace; string
// literals always carry them escaped. Flattening keeps one entry per line.
std::string single_line_json(const std::string &raw_body) {
  const std::string trimmed = common::trim(raw_body);
  if (trimmed.empty() || (trimmed.front() != '{' && trimmed.front() != '[')) {
    return "\"" + common::json_escape(raw_body) + "\"";
  }
  std::string flat = trimmed;
  std::replace_if(
      flat.begin(), flat.end(), [](const char ch) { return ch == '\n' || ch == '\r'; }, ' ');
  return flat;
}

} // namespace

ApiLog::ApiLog(std::filesystem::path path) : path_(std::move(path)) {}

common::Status ApiLog::record(const std::string &endpoint, const std::string &raw_body) {
  return record(endpoint, raw_body, std::chrono::system_clock::now());
}

common::Status ApiLog::record(const std::string &endpoint, const std::string &raw_body,
                              const std::chrono::system_clock::time_point when) {
  const std::string line = "{\"timestamp\":\"" + common::iso8601_utc(when) +
                           "\",\"endpoint\":\"" + common::json_escape(endpoint) +
                           "\",\"response\":" + single_line_json(raw_body) + "}";
  std::lock_guard<std::mutex> lock(mutex_);
  return common::append_line(path_, line);
}

} // namespace julesbot::jules
