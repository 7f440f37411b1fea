#pragma once

#include "mcpbridge/common/json.hpp"
#include "mcpbridge/common/result.hpp"

#include <optional>
#include <string>

namespace mcpbridge::rpc {

using common::Json;

inline constexpr const char *kVersion = "2.0";
inline constexpr int kInternalError = -32603;

inline constexpr const char *kMethodToolsCall = "tools/call";
inline constexpr const char *kMethodToolsList = "tools/list";
inline constexpr const char *kMethodInitialize = "initialize";

/// The subset of a JSON-RPC request the proxy inspects. `document` keeps the
/// whole decoded message so it can be re-serialized with only the edited
/// fields changed.
struct Request {
  Json id;
  std::string method;
  std::string tool_name;
  Json arguments;
  Json document;

  [[nodiscard]] bool is_tool_call() const { return method == kMethodToolsCall; }
  [[nodiscard]] bool has_argument(const std::string &key) const;
  /// Non-empty string argument, or nullopt when absent, null, empty or not a string.
  [[nodiscard]] std::optional<std::string> string_argument(const std::string &key) const;
};

/// One stdin line. `parsed` is empty when the line did not decode as a
/// request; the raw bytes are still forwarded upstream in that case.
struct InboundMessage {
  std::string raw;
  std::optional<Request> parsed;

  /// Id to stamp on a locally built reply: the request id, or null.
  [[nodiscard]] Json reply_id() const;
};

[[nodiscard]] std::optional<Request> parse_request(const std::string &line);
[[nodiscard]] InboundMessage decode_line(std::string line);

/// Serializes the request document. Fails on content that cannot be encoded
/// (invalid UTF-8 introduced by an edit); callers fall back to the raw line.
[[nodiscard]] common::Result<std::string> serialize_request(const Request &request);

[[nodiscard]] std::string make_success(const Json &id, Json result);
[[nodiscard]] std::string make_error(const Json &id, int code, const std::string &message);

/// Tool-call result: `{"content":[{"type":"text","text":...}]}`, with
/// `"isError":true` for application-level failures. Always a success envelope.
[[nodiscard]] std::string make_tool_text_result(const Json &id, const std::string &text,
                                                bool is_error = false);

} // namespace mcpbridge::rpc
