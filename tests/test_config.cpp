#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "julesbot/config/config.hpp"

#include <algorithm>
#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    julesbot::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { julesbot::config::clear_config_path_override(); }
};

// Keeps the developer's real environment out of load_config().
struct IsolatedEnv {
  julesbot::testing::EnvGuard home;
  julesbot::testing::EnvGuard env_file;
  julesbot::testing::EnvGuard config_path;
  julesbot::testing::EnvGuard tg_token;
  julesbot::testing::EnvGuard admin_chat;
  julesbot::testing::EnvGuard jules_token;
  julesbot::testing::EnvGuard log_level;

  explicit IsolatedEnv(const std::filesystem::path &home_dir)
      : home("HOME", home_dir.string()), env_file("JULESBOT_ENV_FILE", std::nullopt),
        config_path("JULESBOT_CONFIG_PATH", std::nullopt), tg_token("TG_TOKEN", std::nullopt),
        admin_chat("ADMIN_CHAT_ID", std::nullopt), jules_token("JULES_TOKEN", std::nullopt),
        log_level("JULESBOT_LOG_LEVEL", std::nullopt) {}
};

bool has_warning_containing(const std::vector<std::string> &warnings, const std::string &needle) {
  return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &warning) {
    return warning.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<julesbot::tests::TestCase> &tests) {
  using julesbot::tests::require;
  namespace cfg = julesbot::config;
  namespace common = julesbot::common;
  using julesbot::testing::EnvGuard;
  using julesbot::testing::TempWorkspace;

  tests.push_back({"config_parse_empty_document_yields_defaults", [] {
                     const auto parsed = cfg::parse_config("");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.monitor.interval_seconds == 60, "interval default");
                     require(config.monitor.duration_minutes == 60, "duration default");
                     require(config.monitor.page_size == 10, "page size default");
                     require(config.monitor.critical_states.size() == 2, "critical default");
                     require(config.jules.base_url == "https://jules.googleapis.com/v1alpha",
                             "base url default");
                     require(config.jules.default_branch == "main", "branch default");
                     require(config.log.level == "info", "log level default");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = cfg::parse_config(R"(
[telegram]
bot_token = "abc:def"
admin_chat_id = "-100200"
poll_timeout_seconds = 5

[jules]
api_key = "key"
base_url = "https://example.test/v1/"
read_timeout_ms = 2500
default_branch = "develop"

[monitor]
interval_seconds = 15
duration_minutes = 30
page_size = 25
critical_states = ["FAILED"]

[log]
level = "DEBUG"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.telegram.bot_token == "abc:def", "token mismatch");
                     require(config.telegram.admin_chat_id == "-100200", "chat id mismatch");
                     require(config.telegram.poll_timeout_seconds == 5, "poll timeout mismatch");
                     require(config.jules.api_key == "key", "api key mismatch");
                     require(config.jules.base_url == "https://example.test/v1",
                             "trailing slash should be stripped");
                     require(config.jules.read_timeout_ms == 2500, "read timeout mismatch");
                     require(config.jules.create_timeout_ms == 30000, "create timeout default");
                     require(config.jules.default_branch == "develop", "branch mismatch");
                     require(config.monitor.interval_seconds == 15, "interval mismatch");
                     require(config.monitor.duration_minutes == 30, "duration mismatch");
                     require(config.monitor.page_size == 25, "page size mismatch");
                     require(config.monitor.critical_states.size() == 1 &&
                                 config.monitor.critical_states[0] == "FAILED",
                             "critical states mismatch");
                     require(config.log.level == "debug", "log level should be lowercased");
                   }});

  tests.push_back({"config_parse_rejects_invalid_toml", [] {
                     const auto parsed = cfg::parse_config("[monitor\n");
                     require(!parsed.ok(), "broken toml should fail");
                     require(parsed.kind() == common::ErrorKind::Configuration,
                             "kind should be configuration");
                     require(parsed.error().find("Invalid config") != std::string::npos,
                             "error should say invalid config");
                   }});

  tests.push_back({"config_validate_reports_all_missing_settings", [] {
                     const cfg::Config config;
                     const auto validated = cfg::validate_config(config);
                     require(!validated.ok(), "empty config should fail validation");
                     require(validated.kind() == common::ErrorKind::Configuration,
                             "kind should be configuration");
                     const auto &error = validated.error();
                     require(error.find("TG_TOKEN") != std::string::npos, "bot token missing");
                     require(error.find("JULES_TOKEN") != std::string::npos, "api key missing");
                     require(error.find("ADMIN_CHAT_ID") != std::string::npos, "chat id missing");
                   }});

  tests.push_back({"config_validate_rejects_zero_values", [] {
                     auto config = julesbot::testing::mock_config();
                     config.monitor.interval_seconds = 0;
                     require(!cfg::validate_config(config).ok(), "zero interval should fail");

                     config = julesbot::testing::mock_config();
                     config.monitor.page_size = 0;
                     require(!cfg::validate_config(config).ok(), "zero page size should fail");

                     config = julesbot::testing::mock_config();
                     config.jules.read_timeout_ms = 0;
                     require(!cfg::validate_config(config).ok(), "zero timeout should fail");

                     config = julesbot::testing::mock_config();
                     config.log.level = "verbose";
                     const auto bad_level = cfg::validate_config(config);
                     require(!bad_level.ok(), "unknown log level should fail");
                     require(bad_level.error().find("verbose") != std::string::npos,
                             "error should name the level");
                   }});

  tests.push_back({"config_negative_interval_in_file_fails_validation", [] {
                     const auto parsed = cfg::parse_config("[monitor]\ninterval_seconds = -5\n");
                     require(parsed.ok(), parsed.error());
                     auto config = parsed.value();
                     config.telegram = julesbot::testing::mock_config().telegram;
                     config.jules.api_key = "key";
                     require(!cfg::validate_config(config).ok(),
                             "negative interval should not pass validation");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     auto config = julesbot::testing::mock_config();
                     const auto clean = cfg::validate_config(config);
                     require(clean.ok(), clean.error());
                     require(clean.value().empty(), "mock config should have no warnings");

                     config.telegram.admin_chat_id = "-1001234";
                     const auto group = cfg::validate_config(config);
                     require(group.ok() && group.value().empty(),
                             "negative group chat ids are valid");

                     config.telegram.admin_chat_id = "@someone";
                     config.jules.base_url = "http://insecure.test";
                     config.monitor.interval_seconds = 3600;
                     config.monitor.critical_states.clear();
                     const auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     const auto &warnings = warned.value();
                     require(warnings.size() == 4, "expected four warnings");
                     require(has_warning_containing(warnings, "not numeric"), "chat id warning");
                     require(has_warning_containing(warnings, "not https"), "https warning");
                     require(has_warning_containing(warnings, "only one poll"),
                             "interval warning");
                     require(has_warning_containing(warnings, "critical_states"),
                             "critical states warning");
                   }});

  tests.push_back({"config_path_override_directory_appends_filename", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "config.toml",
                             "directory override should resolve to config.toml");
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                   }});

  tests.push_back({"config_load_missing_file_uses_defaults_and_env", [] {
                     TempWorkspace workspace;
                     IsolatedEnv env(workspace.path());
                     ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     EnvGuard token("TG_TOKEN", std::string("env:token"));
                     EnvGuard chat("ADMIN_CHAT_ID", std::string(" 999 "));
                     EnvGuard key("JULES_TOKEN", std::string("env-key"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.telegram.bot_token == "env:token", "token from env");
                     require(config.telegram.admin_chat_id == "999", "chat id trimmed");
                     require(config.jules.api_key == "env-key", "api key from env");
                     require(config.monitor.interval_seconds == 60, "defaults kept");
                     require(cfg::validate_config(config).ok(), "env config should validate");
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     TempWorkspace workspace;
                     IsolatedEnv env(workspace.path());
                     workspace.create_file("config.toml", R"(
[telegram]
bot_token = "file-token"
admin_chat_id = "1"

[jules]
api_key = "file-key"

[log]
level = "warn"
)");
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     EnvGuard key("JULES_TOKEN", std::string("env-key"));
                     EnvGuard level("JULESBOT_LOG_LEVEL", std::string("ERROR"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.telegram.bot_token == "file-token", "file token kept");
                     require(config.jules.api_key == "env-key", "env should win over file");
                     require(config.log.level == "error", "log level from env");
                   }});

  tests.push_back({"config_load_reports_file_path_on_parse_error", [] {
                     TempWorkspace workspace;
                     IsolatedEnv env(workspace.path());
                     workspace.create_file("config.toml", "[telegram\n");
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");

                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken file should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"config_dotenv_fills_but_never_overrides", [] {
                     TempWorkspace workspace;
                     IsolatedEnv env(workspace.path());
                     workspace.create_file("bot.env", "# secrets\n"
                                                      "export TG_TOKEN=\"dot:token\"\n"
                                                      "ADMIN_CHAT_ID='321'\n"
                                                      "JULES_TOKEN=dot-key\n"
                                                      "not a line\n");
                     EnvGuard env_file("JULESBOT_ENV_FILE",
                                       (workspace.path() / "bot.env").string());
                     EnvGuard key("JULES_TOKEN", std::string("real-key"));
                     ConfigOverrideGuard guard(workspace.path() / "absent.toml");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.telegram.bot_token == "dot:token", "token from .env");
                     require(config.telegram.admin_chat_id == "321", "quotes stripped");
                     require(config.jules.api_key == "real-key",
                             "existing environment must win over .env");
                   }});

  tests.push_back({"config_api_log_path_expands_home", [] {
                     TempWorkspace workspace;
                     EnvGuard home("HOME", workspace.path().string());
                     const auto parsed =
                         cfg::parse_config("[jules]\napi_log_path = \"~/logs/api.log\"\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().jules.api_log_path ==
                                 (workspace.path() / "logs/api.log").string(),
                             "home should be expanded: " + parsed.value().jules.api_log_path);
                   }});
}
