#include "mcpbridge/proxy/request_rewriter.hpp"

#include "mcpbridge/observability/global.hpp"

namespace mcpbridge::proxy {

RequestRewriter::RequestRewriter(const SessionState &state, GrantToolTable tools)
    : state_(state), tools_(std::move(tools)) {}

std::string RequestRewriter::rewrite(const rpc::InboundMessage &message) const {
  if (!message.parsed.has_value()) {
    return message.raw;
  }
  const auto &request = *message.parsed;

  const auto default_grant = state_.default_grant();
  if (!default_grant.has_value()) {
    return message.raw;
  }
  if (!request.is_tool_call() || !tools_.requires_grant(request.tool_name)) {
    return message.raw;
  }
  if (request.has_argument("grant_id") || request.has_argument("identifier")) {
    return message.raw;
  }

  rpc::Request modified = request;
  auto &params = modified.document["params"];
  auto &arguments = params["arguments"];
  if (!arguments.is_object()) {
    arguments = rpc::Json::object();
  }
  arguments["grant_id"] = *default_grant;

  auto encoded = rpc::serialize_request(modified);
  if (!encoded.ok()) {
    observability::record_error("rewriter", encoded.error());
    return message.raw;
  }
  observability::record_request_rewrite(request.tool_name, *default_grant);
  return encoded.value();
}

} // namespace mcpbridge::proxy
