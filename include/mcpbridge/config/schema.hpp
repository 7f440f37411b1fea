#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge::config {

inline constexpr const char *kEndpointUS = "https://mcp.us.nylas.com";
inline constexpr const char *kEndpointEU = "https://mcp.eu.nylas.com";
inline constexpr std::uint64_t kDefaultTimeoutMs = 90'000;

struct AccountsConfig {
  bool enabled = true;
  std::string db_path = "~/.mcpbridge/grants.db";
};

struct ProxyConfig {
  /// Tools that take a top-level grant_id. Empty means the built-in table.
  std::vector<std::string> grant_tools;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::optional<std::string> api_key;
  std::string region = "us";
  std::optional<std::string> endpoint;
  std::optional<std::string> default_grant;
  std::uint64_t timeout_ms = kDefaultTimeoutMs;
  AccountsConfig accounts;
  ProxyConfig proxy;
  ObservabilityConfig observability;
};

} // namespace mcpbridge::config
