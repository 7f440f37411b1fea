#include "mcpbridge/cli/commands.hpp"

#include "mcpbridge/accounts/sqlite_store.hpp"
#include "mcpbridge/common/cancel.hpp"
#include "mcpbridge/common/fs.hpp"
#include "mcpbridge/config/config.hpp"
#include "mcpbridge/http/client.hpp"
#include "mcpbridge/observability/factory.hpp"
#include "mcpbridge/observability/global.hpp"
#include "mcpbridge/proxy/line_source.hpp"
#include "mcpbridge/proxy/proxy.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace mcpbridge::cli {

namespace {

common::CancelSignal g_cancel;

void handle_stop_signal(int signal_number) { g_cancel.request_stop(signal_number); }

std::string version_string() {
#ifdef MCPBRIDGE_VERSION
  std::string version = MCPBRIDGE_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef MCPBRIDGE_GIT_COMMIT
  const std::string commit = MCPBRIDGE_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "mcpbridge " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// 1 when the flag is present with a value, 0 when absent, -1 when the value is missing.
int take_option(std::vector<std::string> &args, const std::string &long_name,
                std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return -1;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return 1;
    }
    const std::string prefix = long_name + "=";
    if (common::starts_with(args[i], prefix)) {
      out_value = args[i].substr(prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return out_value.empty() ? -1 : 1;
    }
  }
  return 0;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  std::string value;
  const int found = take_option(args, "--config", value);
  if (found < 0) {
    error = "missing value for --config";
    return false;
  }
  if (found > 0) {
    config::set_config_path_override(value);
  }
  return true;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Bridges a stdio JSON-RPC client to the remote MCP endpoint.\n\n";
  std::cout << "Usage: mcpbridge [--config PATH] <command> [flags]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  proxy, serve     Run the stdio proxy until end of input\n";
  std::cout << "  config-path      Print the configuration file path\n";
  std::cout << "  config-check     Validate the configuration and print warnings\n";
  std::cout << "  version          Print the version\n";
  std::cout << "  help             Show this help\n\n";
  std::cout << "Proxy flags:\n";
  std::cout << "  --region us|eu       Upstream region (default us)\n";
  std::cout << "  --endpoint URL       Explicit upstream endpoint\n";
  std::cout << "  --grant ID           Default grant for tool calls\n";
  std::cout << "  --accounts-db PATH   Local grants database\n";
  std::cout << "  --no-accounts        Do not answer get_grant locally\n";
  std::cout << "  --timeout-ms N       Upstream request timeout\n";
}

std::shared_ptr<accounts::AccountStore> open_account_store(const config::Config &cfg) {
  if (!cfg.accounts.enabled) {
    return nullptr;
  }
  std::error_code ec;
  const std::filesystem::path db_path(cfg.accounts.db_path);
  if (!std::filesystem::exists(db_path, ec)) {
    return nullptr;
  }
  auto store = std::make_shared<accounts::SqliteAccountStore>(db_path);
  if (const auto status = store->open_status(); !status.ok()) {
    observability::record_warning("accounts", status.error());
    return nullptr;
  }
  return store;
}

proxy::ProxyOptions build_proxy_options(const config::Config &cfg) {
  proxy::ProxyOptions options;
  options.endpoint = config::resolve_endpoint(cfg);
  options.api_key = cfg.api_key.value_or("");
  options.timeout_ms = cfg.timeout_ms;
  options.default_grant = cfg.default_grant;
  if (!cfg.proxy.grant_tools.empty()) {
    options.grant_tools = proxy::GrantToolTable(cfg.proxy.grant_tools);
  }
  return options;
}

int run_proxy(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  config::Config &settings = cfg.value();

  std::string flag_error;
  if (!apply_proxy_flags(args, settings, flag_error)) {
    std::cerr << flag_error << "\n";
    return 1;
  }
  if (!args.empty()) {
    std::cerr << "Unknown proxy argument: " << args.front() << "\n";
    return 1;
  }

  auto validation = config::validate_config(settings);
  if (!validation.ok()) {
    std::cerr << validation.error() << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(settings));
  for (const auto &warning : validation.value()) {
    observability::record_warning("config", warning);
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  proxy::Proxy bridge(build_proxy_options(settings), std::make_shared<http::CurlHttpClient>(),
                      open_account_store(settings));
  proxy::FdLineSource input(STDIN_FILENO);
  const auto status = bridge.run(input, std::cout, g_cancel);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!status.ok()) {
    std::cerr << "proxy stopped: " << status.error() << "\n";
    return 1;
  }
  return 0;
}

int run_config_check() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    std::cerr << "invalid: " << validation.error() << "\n";
    return 1;
  }
  for (const auto &warning : validation.value()) {
    std::cout << "warning: " << warning << "\n";
  }
  std::cout << "Endpoint: " << config::resolve_endpoint(cfg.value()) << "\n";
  std::cout << "Default grant: " << cfg.value().default_grant.value_or("(none)") << "\n";
  std::cout << "Accounts: "
            << (cfg.value().accounts.enabled ? cfg.value().accounts.db_path : "disabled") << "\n";
  std::cout << "ok\n";
  return 0;
}

} // namespace

bool apply_proxy_flags(std::vector<std::string> &args, config::Config &config,
                       std::string &error) {
  std::string value;
  const auto missing = [&error](const std::string &flag) {
    error = "missing value for " + flag;
    return false;
  };

  int found = take_option(args, "--region", value);
  if (found < 0) {
    return missing("--region");
  }
  if (found > 0) {
    config.region = common::to_lower(common::trim(value));
  }

  found = take_option(args, "--endpoint", value);
  if (found < 0) {
    return missing("--endpoint");
  }
  if (found > 0) {
    config.endpoint = common::trim(value);
  }

  found = take_option(args, "--grant", value);
  if (found < 0) {
    return missing("--grant");
  }
  if (found > 0) {
    config.default_grant = common::trim(value);
  }

  found = take_option(args, "--accounts-db", value);
  if (found < 0) {
    return missing("--accounts-db");
  }
  if (found > 0) {
    config.accounts.db_path = common::expand_path(value);
    config.accounts.enabled = true;
  }

  if (take_flag(args, "--no-accounts")) {
    config.accounts.enabled = false;
  }

  found = take_option(args, "--timeout-ms", value);
  if (found < 0) {
    return missing("--timeout-ms");
  }
  if (found > 0) {
    try {
      std::size_t consumed = 0;
      const auto parsed = std::stoull(value, &consumed);
      if (consumed != value.size()) {
        error = "invalid --timeout-ms: " + value;
        return false;
      }
      config.timeout_ms = parsed;
    } catch (const std::exception &) {
      error = "invalid --timeout-ms: " + value;
      return false;
    }
  }
  return true;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config-check") {
    return run_config_check();
  }
  if (subcommand == "proxy" || subcommand == "serve") {
    return run_proxy(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace mcpbridge::cli
