#include "julesbot/jules/jules_client.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/common/json_util.hpp"
#include "julesbot/observability/global.hpp"

#include <array>

namespace julesbot::jules {

namespace {

constexpr std::size_t ERROR_SNIPPET_LIMIT = 200;

// Activity payloads name their kind by the key they carry when no "type" is sent.
constexpr std::array<const char *, 8> ACTIVITY_KINDS = {
    "planGenerated",  "planApproved",    "userMessaged",     "agentMessaged",
    "progressUpdated", "sessionCompleted", "sessionFailed", "artifacts"};

std::string snippet(const std::string &body) {
  const std::string trimmed = common::trim(body);
  if (trimmed.size() <= ERROR_SNIPPET_LIMIT) {
    return trimmed;
  }
  return trimmed.substr(0, ERROR_SNIPPET_LIMIT) + "...";
}

bool looks_like_object(const std::string &body) {
  const std::string trimmed = common::trim(body);
  return trimmed.size() >= 2 && trimmed.front() == '{' && trimmed.back() == '}';
}

Session parse_session(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  const auto field = [&fields](const char *key) -> std::string {
    const auto it = fields.find(key);
    return it == fields.end() ? "" : it->second;
  };

  Session session;
  session.id = field("id");
  if (session.id.empty()) {
    session.id = clean_session_id(field("name"));
  }
  session.title = field("title");
  session.state = field("state");
  session.url = field("url");
  return session;
}

Activity parse_activity(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  Activity activity;
  if (const auto it = fields.find("createTime"); it != fields.end()) {
    activity.create_time = it->second;
  }
  if (const auto it = fields.find("type"); it != fields.end() && !it->second.empty()) {
    activity.type = it->second;
    return activity;
  }
  for (const char *kind : ACTIVITY_KINDS) {
    if (fields.contains(kind)) {
      activity.type = kind;
      return activity;
    }
  }
  activity.type = "Unknown";
  return activity;
}

} // namespace

std::string clean_session_id(const std::string &session_id) {
  const std::string trimmed = common::trim(session_id);
  if (common::starts_with(trimmed, "sessions/")) {
    return trimmed.substr(9);
  }
  return trimmed;
}

std::string default_session_url(const std::string &session_id) {
  return "https://jules.google.com/session/" + clean_session_id(session_id);
}

JulesClient::JulesClient(http::HttpClient &http, JulesClientOptions options,
                         std::shared_ptr<ApiLog> api_log)
    : http_(http), options_(std::move(options)), api_log_(std::move(api_log)) {}

http::HeaderMap JulesClient::headers() const {
  return {{"X-Goog-Api-Key", options_.api_key}, {"Content-Type", "application/json"}};
}

common::Result<std::string> JulesClient::check(const std::string &endpoint,
                                               const http::HttpResponse &response,
                                               const std::chrono::milliseconds latency) {
  observability::record_api_latency(endpoint, latency);

  std::string error;
  if (response.network_error) {
    error = endpoint + " failed: " +
            (response.timeout ? std::string("timed out") : response.network_error_message);
  } else if (response.status < 200 || response.status >= 300) {
    error = endpoint + " failed: HTTP " + std::to_string(response.status) + ": " +
            snippet(response.body);
  } else if (!looks_like_object(response.body)) {
    error = endpoint + " failed: unparseable response: " + snippet(response.body);
  }
  if (!error.empty()) {
    observability::record_error("jules", error);
    return common::Result<std::string>::failure(common::ErrorKind::Fetch, error);
  }

  if (api_log_ != nullptr) {
    if (auto logged = api_log_->record(endpoint, response.body); !logged.ok()) {
      observability::record_error("jules.api_log", logged.error());
    }
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::string> JulesClient::get(const std::string &endpoint,
                                             const std::string &path) {
  const auto started = std::chrono::steady_clock::now();
  const auto response = http_.get(options_.base_url + path, headers(), options_.read_timeout_ms);
  return check(endpoint, response,
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started));
}

common::Result<std::vector<Session>> JulesClient::list_sessions(const std::uint32_t page_size) {
  const auto body = get("list_sessions", "/sessions?pageSize=" + std::to_string(page_size));
  if (!body.ok()) {
    return common::Result<std::vector<Session>>::failure(body.status());
  }

  std::vector<Session> sessions;
  for (const auto &item :
       common::json_split_top_level_objects(common::json_get_array(body.value(), "sessions"))) {
    sessions.push_back(parse_session(item));
  }
  return common::Result<std::vector<Session>>::success(std::move(sessions));
}

common::Result<Session> JulesClient::get_session(const std::string &session_id) {
  const std::string clean_id = clean_session_id(session_id);
  const auto body = get("get_session/" + clean_id, "/sessions/" + clean_id);
  if (!body.ok()) {
    return common::Result<Session>::failure(body.status());
  }

  Session session = parse_session(body.value());
  if (session.id.empty()) {
    const std::string error = "get_session/" + clean_id + " failed: session not found";
    observability::record_error("jules", error);
    return common::Result<Session>::failure(common::ErrorKind::Fetch, error);
  }
  session.id = clean_session_id(session.id);
  if (session.url.empty()) {
    session.url = default_session_url(session.id);
  }
  return common::Result<Session>::success(std::move(session));
}

common::Result<std::vector<Activity>>
JulesClient::list_activities(const std::string &session_id, const std::uint32_t page_size) {
  const std::string clean_id = clean_session_id(session_id);
  const auto body = get("list_activities/" + clean_id, "/sessions/" + clean_id +
                                                           "/activities?pageSize=" +
                                                           std::to_string(page_size));
  if (!body.ok()) {
    return common::Result<std::vector<Activity>>::failure(body.status());
  }

  std::vector<Activity> activities;
  for (const auto &item : common::json_split_top_level_objects(
           common::json_get_array(body.value(), "activities"))) {
    activities.push_back(parse_activity(item));
  }
  return common::Result<std::vector<Activity>>::success(std::move(activities));
}

common::Result<CreatedSession> JulesClient::create_session(const std::string &owner,
                                                           const std::string &repo,
                                                           const std::string &prompt,
                                                           const std::string &branch) {
  const std::string payload =
      "{\"prompt\":\"" + common::json_escape(prompt) +
      "\",\"sourceContext\":{\"source\":\"sources/github/" + common::json_escape(owner) + "/" +
      common::json_escape(repo) + "\",\"githubRepoContext\":{\"startingBranch\":\"" +
      common::json_escape(branch) + "\"}}}";

  const auto started = std::chrono::steady_clock::now();
  const auto response = http_.post_json(options_.base_url + "/sessions", headers(), payload,
                                        options_.create_timeout_ms);
  const auto body =
      check("create_session", response,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started));
  if (!body.ok()) {
    return common::Result<CreatedSession>::failure(body.status());
  }

  const Session parsed = parse_session(body.value());
  if (parsed.id.empty()) {
    const std::string error = "create_session failed: response carried no session id";
    observability::record_error("jules", error);
    return common::Result<CreatedSession>::failure(common::ErrorKind::Fetch, error);
  }

  CreatedSession created;
  created.id = clean_session_id(parsed.id);
  created.url = parsed.url.empty() ? default_session_url(created.id) : parsed.url;
  created.state = parsed.state;
  return common::Result<CreatedSession>::success(std::move(created));
}

} // namespace julesbot::jules
