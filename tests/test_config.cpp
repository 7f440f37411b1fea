#include "test_framework.hpp"

#include "mcpbridge/cli/commands.hpp"
#include "mcpbridge/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

using mcpbridge::testing::EnvGuard;
using mcpbridge::testing::TempWorkspace;

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = mcpbridge::config::config_path_override();
    if (next.has_value()) {
      mcpbridge::config::set_config_path_override(*next);
    } else {
      mcpbridge::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      mcpbridge::config::set_config_path_override(*old_override);
    } else {
      mcpbridge::config::clear_config_path_override();
    }
  }
};

/// Clears every variable load_config reads so the host environment cannot leak in.
struct CleanEnv {
  EnvGuard config_path{"MCPBRIDGE_CONFIG_PATH", std::nullopt};
  EnvGuard env_file{"MCPBRIDGE_ENV_FILE", std::nullopt};
  EnvGuard api_key{"MCPBRIDGE_API_KEY", std::nullopt};
  EnvGuard nylas_key{"NYLAS_API_KEY", std::nullopt};
  EnvGuard region{"MCPBRIDGE_REGION", std::nullopt};
  EnvGuard endpoint{"MCPBRIDGE_ENDPOINT", std::nullopt};
  EnvGuard grant{"MCPBRIDGE_DEFAULT_GRANT", std::nullopt};
  EnvGuard db{"MCPBRIDGE_ACCOUNTS_DB", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<mcpbridge::tests::TestCase> &tests) {
  using mcpbridge::tests::require;
  namespace cfg = mcpbridge::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(dir.value() == home.path() / ".mcpbridge", "config dir mismatch");
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(!config.api_key.has_value(), "no api key by default");
                     require(config.region == "us", "default region should be us");
                     require(config.timeout_ms == 90000, "default timeout should be 90s");
                     require(config.accounts.enabled, "accounts enabled by default");
                     require(config.accounts.db_path ==
                                 (home.path() / ".mcpbridge" / "grants.db").string(),
                             "db path should expand under HOME: " + config.accounts.db_path);
                     require(cfg::resolve_endpoint(config) == cfg::kEndpointUS, "US endpoint");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());

                     home.create_file(".mcpbridge/config.toml", R"(
api_key = "key123"
region = "eu"
default_grant = "grant-7"
timeout_ms = 30_000

[accounts]
enabled = false
db_path = "/var/lib/grants.db"

[proxy]
grant_tools = ["list_events", "custom_tool"]

[observability]
backend = "none"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.api_key == std::optional<std::string>("key123"), "api key");
                     require(cfg::resolve_endpoint(config) == cfg::kEndpointEU, "EU endpoint");
                     require(config.default_grant == std::optional<std::string>("grant-7"),
                             "default grant");
                     require(config.timeout_ms == 30000, "timeout");
                     require(!config.accounts.enabled, "accounts disabled");
                     require(config.accounts.db_path == "/var/lib/grants.db", "db path");
                     require(config.proxy.grant_tools.size() == 2, "grant tools");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"env_overrides_win_over_file", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     home.create_file(".mcpbridge/config.toml", "api_key = \"file-key\"\n");

                     const EnvGuard key("MCPBRIDGE_API_KEY", "env-key");
                     const EnvGuard region("MCPBRIDGE_REGION", "eu");
                     const EnvGuard grant("MCPBRIDGE_DEFAULT_GRANT", "env-grant");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().api_key == std::optional<std::string>("env-key"),
                             "env api key should win");
                     require(loaded.value().region == "eu", "env region");
                     require(loaded.value().default_grant == std::optional<std::string>("env-grant"),
                             "env grant");
                   }});

  tests.push_back({"nylas_api_key_is_a_fallback", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard nylas("NYLAS_API_KEY", "nylas-key");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().api_key == std::optional<std::string>("nylas-key"),
                             "NYLAS_API_KEY should be used when nothing else is set");
                   }});

  tests.push_back({"dotenv_in_config_dir_is_loaded", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     home.create_file(".mcpbridge/.env",
                                      "# comment\nexport MCPBRIDGE_API_KEY=\"dotenv-key\"\n");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().api_key == std::optional<std::string>("dotenv-key"),
                             ".env value expected");
                   }});

  tests.push_back({"config_path_override_accepts_files", [] {
                     const TempWorkspace workspace;
                     const CleanEnv clean;
                     const auto file = workspace.path() / "custom.toml";
                     const ConfigOverrideGuard cfg_override(file);
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == file, "override file should be used");
                   }});

  tests.push_back({"invalid_toml_reports_path", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard cfg_override;
                     home.create_file(".mcpbridge/config.toml", "api_key\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "invalid toml should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"validate_config_rejects_unusable_settings", [] {
                     auto config = mcpbridge::testing::mock_config();
                     require(cfg::validate_config(config).ok(), "mock config should validate");

                     auto no_key = config;
                     no_key.api_key = std::string("  ");
                     require(!cfg::validate_config(no_key).ok(), "blank api key");

                     auto bad_region = config;
                     bad_region.region = "ap";
                     require(!cfg::validate_config(bad_region).ok(), "unknown region");

                     auto zero_timeout = config;
                     zero_timeout.timeout_ms = 0;
                     require(!cfg::validate_config(zero_timeout).ok(), "zero timeout");

                     auto bad_endpoint = config;
                     bad_endpoint.endpoint = "ftp://example.com";
                     require(!cfg::validate_config(bad_endpoint).ok(), "non-http endpoint");
                   }});

  tests.push_back({"validate_config_warnings", [] {
                     auto config = mcpbridge::testing::mock_config();
                     config.endpoint = "http://localhost:8080";
                     config.accounts.enabled = true;
                     config.accounts.db_path = "/nonexistent/mcpbridge/grants.db";
                     config.default_grant = std::string("");
                     config.observability.backend = "syslog";
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 4, "expected four warnings, got " +
                                                             std::to_string(result.value().size()));
                   }});

  tests.push_back({"endpoint_for_region_is_case_insensitive", [] {
                     require(cfg::endpoint_for_region("EU") == cfg::kEndpointEU, "EU");
                     require(cfg::endpoint_for_region("us") == cfg::kEndpointUS, "us");
                     require(cfg::endpoint_for_region("") == cfg::kEndpointUS, "empty defaults to US");
                   }});

  tests.push_back({"cli_proxy_flags_override_config", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     auto config = mcpbridge::testing::mock_config();
                     std::vector<std::string> args = {"--region",      "EU",        "--grant=g-1",
                                                      "--accounts-db", "~/grants.db", "--timeout-ms",
                                                      "2500",          "extra"};
                     std::string error;
                     require(mcpbridge::cli::apply_proxy_flags(args, config, error), error);
                     require(config.region == "eu", "region flag");
                     require(config.default_grant == std::optional<std::string>("g-1"), "grant flag");
                     require(config.accounts.enabled, "accounts-db enables the store");
                     require(config.accounts.db_path == (home.path() / "grants.db").string(),
                             "accounts-db should expand");
                     require(config.timeout_ms == 2500, "timeout flag");
                     require(args.size() == 1 && args[0] == "extra", "unknown tokens stay");
                   }});

  tests.push_back({"cli_proxy_flags_reject_bad_values", [] {
                     auto config = mcpbridge::testing::mock_config();
                     std::vector<std::string> missing = {"--grant"};
                     std::string error;
                     require(!mcpbridge::cli::apply_proxy_flags(missing, config, error),
                             "missing value should fail");
                     require(error == "missing value for --grant", "error mismatch: " + error);

                     std::vector<std::string> bad_number = {"--timeout-ms", "12abc"};
                     require(!mcpbridge::cli::apply_proxy_flags(bad_number, config, error),
                             "bad number should fail");

                     std::vector<std::string> no_accounts = {"--no-accounts"};
                     config.accounts.enabled = true;
                     require(mcpbridge::cli::apply_proxy_flags(no_accounts, config, error), error);
                     require(!config.accounts.enabled, "--no-accounts disables the store");
                   }});
}
