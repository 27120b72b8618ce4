#include "julesbot/cli/commands.hpp"

#include "julesbot/common/fs.hpp"
#include "julesbot/config/config.hpp"
#include "julesbot/observability/factory.hpp"
#include "julesbot/observability/global.hpp"
#include "julesbot/runtime/app.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace julesbot::cli {

namespace {

std::string version_string() {
#ifdef JULESBOT_VERSION
  return std::string("julesbot ") + JULESBOT_VERSION;
#else
  return "julesbot 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

void print_help() {
  std::cout << version_string() << ": Jules session monitor for Telegram\n\n";
  std::cout << "Usage: julesbot [--config PATH] [command]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run            Serve chat commands until interrupted (default)\n";
  std::cout << "  check-config   Load and validate the configuration\n";
  std::cout << "  version        Show version\n";
  std::cout << "  help           Show this help\n\n";
  std::cout << "Environment: TG_TOKEN, JULES_TOKEN, ADMIN_CHAT_ID, JULESBOT_LOG_LEVEL,\n";
  std::cout << "             JULESBOT_CONFIG_PATH, JULESBOT_ENV_FILE\n";
}

common::Result<config::Config> load_valid_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return loaded;
}

int run_check_config() {
  const auto path = config::config_path();
  auto loaded = load_valid_config();
  if (!loaded.ok()) {
    std::cerr << "Configuration error: " << loaded.error() << "\n";
    return 1;
  }
  std::cout << "Configuration OK";
  if (path.ok()) {
    std::cout << " (" << path.value().string() << ")";
  }
  std::cout << "\n";
  return 0;
}

int run_bot() {
  auto loaded = load_valid_config();
  if (!loaded.ok()) {
    std::cerr << "Configuration error: " << loaded.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));

  runtime::Application app(std::move(loaded.value()));
  const auto status = app.run();
  observability::set_global_observer(nullptr);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  const std::string subcommand = args.empty() ? "run" : args[0];
  if (subcommand == "run") {
    return run_bot();
  }
  if (subcommand == "check-config") {
    return run_check_config();
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace julesbot::cli
