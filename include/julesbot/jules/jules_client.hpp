#pragma once

#include "julesbot/http/http_client.hpp"
#include "julesbot/jules/api_log.hpp"
#include "julesbot/jules/session_api.hpp"

#include <memory>

namespace julesbot::jules {

struct JulesClientOptions {
  std::string base_url = "https://jules.googleapis.com/v1alpha";
  std::string api_key;
  std::uint64_t read_timeout_ms = 10'000;
  std::uint64_t create_timeout_ms = 30'000;
};

/// REST client for the Jules sessions API.
class JulesClient final : public ISessionApi {
public:
  /// api_log may be null, which disables the audit trail.
  JulesClient(http::HttpClient &http, JulesClientOptions options,
              std::shared_ptr<ApiLog> api_log = nullptr);

  [[nodiscard]] common::Result<std::vector<Session>>
  list_sessions(std::uint32_t page_size) override;
  [[nodiscard]] common::Result<Session> get_session(const std::string &session_id) override;
  [[nodiscard]] common::Result<std::vector<Activity>>
  list_activities(const std::string &session_id, std::uint32_t page_size) override;
  [[nodiscard]] common::Result<CreatedSession>
  create_session(const std::string &owner, const std::string &repo, const std::string &prompt,
                 const std::string &branch) override;

private:
  [[nodiscard]] http::HeaderMap headers() const;
  [[nodiscard]] common::Result<std::string> get(const std::string &endpoint,
                                                const std::string &path);
  [[nodiscard]] common::Result<std::string> check(const std::string &endpoint,
                                                  const http::HttpResponse &response,
                                                  std::chrono::milliseconds latency);

  http::HttpClient &http_;
  JulesClientOptions options_;
  std::shared_ptr<ApiLog> api_log_;
};

/// "sessions/123" -> "123"; other ids pass through unchanged.
[[nodiscard]] std::string clean_session_id(const std::string &session_id);

/// Fallback web URL for a session that came back without one.
[[nodiscard]] std::string default_session_url(const std::string &session_id);

} // namespace julesbot::jules
