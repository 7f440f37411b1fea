#pragma once

#include "mcpbridge/common/result.hpp"
#include "mcpbridge/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace mcpbridge::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Upstream endpoint for a region selector: "eu" (any case) or US otherwise.
[[nodiscard]] std::string endpoint_for_region(const std::string &region);
/// Explicit endpoint if configured, else the region endpoint.
[[nodiscard]] std::string resolve_endpoint(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Fails on unusable settings; on success returns non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace mcpbridge::config
