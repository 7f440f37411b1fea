#pragma once

#include <string>
#include <vector>

namespace mcpbridge::http {

/// Splits a Server-Sent Events body into its `data:` payloads, one entry per
/// non-empty `data:` line, in stream order. A single space after the colon is
/// dropped. Lines of any other field type and comments are ignored.
[[nodiscard]] std::vector<std::string> extract_sse_data_lines(const std::string &body);

[[nodiscard]] bool is_event_stream(const std::string &content_type);

} // namespace mcpbridge::http
