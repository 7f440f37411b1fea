#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcpbridge::common {

/// JSON tree that keeps object keys in document order, so a rewritten message
/// differs from its source only where it was edited.
using Json = nlohmann::ordered_json;

/// Parses `text` without throwing. Returns nullopt on malformed input.
[[nodiscard]] std::optional<Json> parse_json(const std::string &text);

/// Serializes without throwing; invalid UTF-8 is replaced with U+FFFD.
[[nodiscard]] std::string dump_json(const Json &value);

} // namespace mcpbridge::common
