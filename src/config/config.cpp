#include "julesbot/config/config.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace julesbot::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".julesbot";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("JULESBOT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      const char code = value[++i];
      out.push_back(code == 'n' ? '\n' : code == 't' ? '\t' : code);
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Variables already present in the environment win over .env files.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("JULESBOT_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto home = common::home_dir(); home.ok()) {
    candidates.push_back(home.value() / CONFIG_FOLDER / ".env");
  }
  std::error_code ec;
  if (const auto cwd = std::filesystem::current_path(ec); !ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

// Out-of-range values become 0 so validate_config reports them.
std::uint32_t read_u32(const common::TomlDocument &doc, const std::string &key,
                       const std::uint32_t fallback) {
  const std::int64_t value = doc.get_int(key, fallback);
  if (value < 0 || value > std::numeric_limits<std::uint32_t>::max()) {
    return 0;
  }
  return static_cast<std::uint32_t>(value);
}

bool is_chat_id(const std::string &value) {
  if (common::starts_with(value, "-")) {
    return common::is_all_digits(value.substr(1));
  }
  return common::is_all_digits(value);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    if (override_path->has_parent_path()) {
      return common::Result<std::filesystem::path>::success(override_path->parent_path());
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
      return common::Result<std::filesystem::path>::failure(
          common::ErrorKind::Configuration, "unable to resolve current directory");
    }
    return common::Result<std::filesystem::path>::success(cwd);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.status());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                           "Invalid config: " + parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  config.telegram.bot_token = doc.get_string("telegram.bot_token", config.telegram.bot_token);
  config.telegram.admin_chat_id =
      doc.get_string("telegram.admin_chat_id", config.telegram.admin_chat_id);
  config.telegram.poll_timeout_seconds =
      read_u32(doc, "telegram.poll_timeout_seconds", config.telegram.poll_timeout_seconds);

  config.jules.api_key = doc.get_string("jules.api_key", config.jules.api_key);
  config.jules.base_url = doc.get_string("jules.base_url", config.jules.base_url);
  while (!config.jules.base_url.empty() && config.jules.base_url.back() == '/') {
    config.jules.base_url.pop_back();
  }
  if (doc.has("jules.api_log_path")) {
    const std::string log_path = doc.get_string("jules.api_log_path");
    config.jules.api_log_path = log_path.empty() ? log_path : common::expand_path(log_path);
  }
  config.jules.read_timeout_ms =
      read_u32(doc, "jules.read_timeout_ms", config.jules.read_timeout_ms);
  config.jules.create_timeout_ms =
      read_u32(doc, "jules.create_timeout_ms", config.jules.create_timeout_ms);
  config.jules.default_branch =
      doc.get_string("jules.default_branch", config.jules.default_branch);

  config.monitor.interval_seconds =
      read_u32(doc, "monitor.interval_seconds", config.monitor.interval_seconds);
  config.monitor.duration_minutes =
      read_u32(doc, "monitor.duration_minutes", config.monitor.duration_minutes);
  config.monitor.page_size = read_u32(doc, "monitor.page_size", config.monitor.page_size);
  config.monitor.critical_states =
      doc.get_string_array("monitor.critical_states", config.monitor.critical_states);

  config.log.level = common::to_lower(doc.get_string("log.level", config.log.level));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.status());
  }
  const auto &path = path_result.value();

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                             "Unable to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                             path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (auto token = env_value("TG_TOKEN"); token.has_value()) {
    config.telegram.bot_token = *token;
  }
  if (auto chat = env_value("ADMIN_CHAT_ID"); chat.has_value()) {
    config.telegram.admin_chat_id = common::trim(*chat);
  }
  if (auto key = env_value("JULES_TOKEN"); key.has_value()) {
    config.jules.api_key = *key;
  }
  if (auto level = env_value("JULESBOT_LOG_LEVEL"); level.has_value()) {
    config.log.level = common::to_lower(common::trim(*level));
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  std::vector<std::string> missing;
  if (common::trim(config.telegram.bot_token).empty()) {
    missing.emplace_back("telegram.bot_token (TG_TOKEN)");
  }
  if (common::trim(config.jules.api_key).empty()) {
    missing.emplace_back("jules.api_key (JULES_TOKEN)");
  }
  if (common::trim(config.telegram.admin_chat_id).empty()) {
    missing.emplace_back("telegram.admin_chat_id (ADMIN_CHAT_ID)");
  }
  if (!missing.empty()) {
    std::string message = "Missing required settings:";
    for (const auto &name : missing) {
      message += " " + name;
    }
    return ValidationResult::failure(common::ErrorKind::Configuration, message);
  }

  if (config.monitor.interval_seconds == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "monitor.interval_seconds must be > 0");
  }
  if (config.monitor.duration_minutes == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "monitor.duration_minutes must be > 0");
  }
  if (config.monitor.page_size == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "monitor.page_size must be > 0");
  }
  if (config.jules.read_timeout_ms == 0 || config.jules.create_timeout_ms == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "jules timeouts must be > 0");
  }

  const std::string &level = config.log.level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "Invalid log.level: " + level);
  }

  if (!is_chat_id(common::trim(config.telegram.admin_chat_id))) {
    warnings.push_back("telegram.admin_chat_id is not numeric: " + config.telegram.admin_chat_id);
  }
  if (config.monitor.critical_states.empty()) {
    warnings.push_back("monitor.critical_states is empty; new sessions are never reported");
  }
  if (!common::starts_with(config.jules.base_url, "https://")) {
    warnings.push_back("jules.base_url is not https: " + config.jules.base_url);
  }
  if (config.monitor.interval_seconds >=
      static_cast<std::uint64_t>(config.monitor.duration_minutes) * 60) {
    warnings.push_back("monitor.interval_seconds covers the whole run; only one poll will happen");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace julesbot::config
