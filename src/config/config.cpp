#include "mcpbridge/config/config.hpp"

#include "mcpbridge/common/fs.hpp"
#include "mcpbridge/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace mcpbridge::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".mcpbridge";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("MCPBRIDGE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::string> non_empty_env(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
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
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const auto env_file = non_empty_env("MCPBRIDGE_ENV_FILE"); env_file.has_value()) {
    candidates.emplace_back(common::expand_path(*env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

void apply_document(Config &config, const common::TomlDocument &doc) {
  if (doc.has("api_key")) {
    config.api_key = expand_config_value(doc.get_string("api_key"));
  }
  config.region = doc.get_string("region", config.region);
  if (doc.has("endpoint")) {
    config.endpoint = expand_config_value(doc.get_string("endpoint"));
  }
  if (doc.has("default_grant")) {
    config.default_grant = expand_config_value(doc.get_string("default_grant"));
  }
  config.timeout_ms = doc.get_u64("timeout_ms", config.timeout_ms);

  config.accounts.enabled = doc.get_bool("accounts.enabled", config.accounts.enabled);
  config.accounts.db_path = doc.get_string("accounts.db_path", config.accounts.db_path);

  config.proxy.grant_tools = doc.get_string_array("proxy.grant_tools", config.proxy.grant_tools);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string endpoint_for_region(const std::string &region) {
  if (common::to_lower(common::trim(region)) == "eu") {
    return kEndpointEU;
  }
  return kEndpointUS;
}

std::string resolve_endpoint(const Config &config) {
  if (config.endpoint.has_value() && !common::trim(*config.endpoint).empty()) {
    return common::trim(*config.endpoint);
  }
  return endpoint_for_region(config.region);
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto key = non_empty_env("MCPBRIDGE_API_KEY"); key.has_value()) {
    config.api_key = *key;
  } else if (!config.api_key.has_value() || common::trim(*config.api_key).empty()) {
    if (const auto nylas_key = non_empty_env("NYLAS_API_KEY"); nylas_key.has_value()) {
      config.api_key = *nylas_key;
    }
  }
  if (const auto region = non_empty_env("MCPBRIDGE_REGION"); region.has_value()) {
    config.region = *region;
  }
  if (const auto endpoint = non_empty_env("MCPBRIDGE_ENDPOINT"); endpoint.has_value()) {
    config.endpoint = *endpoint;
  }
  if (const auto grant = non_empty_env("MCPBRIDGE_DEFAULT_GRANT"); grant.has_value()) {
    config.default_grant = *grant;
  }
  if (const auto db = non_empty_env("MCPBRIDGE_ACCOUNTS_DB"); db.has_value()) {
    config.accounts.db_path = *db;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  Config config;
  apply_document(config, parsed.value());
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  Config config;
  if (std::filesystem::exists(path)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  config.accounts.db_path = common::expand_path(config.accounts.db_path);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidateResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!config.api_key.has_value() || common::trim(*config.api_key).empty()) {
    return ValidateResult::failure(
        "api_key is not set (config api_key, MCPBRIDGE_API_KEY or NYLAS_API_KEY)");
  }

  const std::string region = common::to_lower(common::trim(config.region));
  if (region != "us" && region != "eu") {
    return ValidateResult::failure("Invalid region: " + config.region + " (expected us or eu)");
  }

  if (config.timeout_ms == 0) {
    return ValidateResult::failure("timeout_ms must be greater than zero");
  }

  if (config.endpoint.has_value()) {
    const std::string endpoint = common::to_lower(common::trim(*config.endpoint));
    if (!common::starts_with(endpoint, "https://") && !common::starts_with(endpoint, "http://")) {
      return ValidateResult::failure("endpoint must be an http(s) URL: " + *config.endpoint);
    }
    if (common::starts_with(endpoint, "http://")) {
      warnings.push_back("endpoint uses plain http; the API key is sent unencrypted");
    }
  }

  if (config.accounts.enabled) {
    std::error_code ec;
    if (!std::filesystem::exists(common::expand_path(config.accounts.db_path), ec)) {
      warnings.push_back("accounts database not found: " + config.accounts.db_path +
                         " (get_grant without email will be forwarded upstream)");
    }
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', logging to stderr");
  }

  if (config.default_grant.has_value() && common::trim(*config.default_grant).empty()) {
    warnings.push_back("default_grant is empty and will be ignored");
  }

  return ValidateResult::success(std::move(warnings));
}

} // namespace mcpbridge::config
