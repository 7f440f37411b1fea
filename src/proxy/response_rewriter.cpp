#include "mcpbridge/proxy/response_rewriter.hpp"

#include "mcpbridge/common/json.hpp"
#include "mcpbridge/proxy/grant_tools.hpp"
#include "mcpbridge/rpc/message.hpp"

#include <utility>

namespace mcpbridge::proxy {

namespace {

using common::Json;

/// result object of a JSON-RPC reply, or nullptr.
Json *find_result(Json &reply) {
  if (!reply.is_object()) {
    return nullptr;
  }
  const auto it = reply.find("result");
  if (it == reply.end() || !it->is_object()) {
    return nullptr;
  }
  return &*it;
}

Json *find_tool(Json &result, const std::string &name) {
  const auto tools = result.find("tools");
  if (tools == result.end() || !tools->is_array()) {
    return nullptr;
  }
  for (auto &tool : *tools) {
    if (!tool.is_object()) {
      continue;
    }
    const auto tool_name = tool.find("name");
    if (tool_name != tool.end() && tool_name->is_string() && *tool_name == name) {
      return &tool;
    }
  }
  return nullptr;
}

bool drop_required_email(Json &tool) {
  const auto schema = tool.find("inputSchema");
  if (schema == tool.end() || !schema->is_object()) {
    return false;
  }
  const auto required = schema->find("required");
  if (required == schema->end() || !required->is_array()) {
    return false;
  }
  const auto before = required->size();
  Json kept = Json::array();
  for (const auto &entry : *required) {
    if (!(entry.is_string() && entry == "email")) {
      kept.push_back(entry);
    }
  }
  if (kept.size() == before) {
    return false;
  }
  *required = std::move(kept);
  return true;
}

bool append_description_sentence(Json &tool) {
  const auto description = tool.find("description");
  if (description == tool.end() || !description->is_string()) {
    return false;
  }
  auto &text = description->get_ref<std::string &>();
  if (text.find(kGetGrantOptionalEmailSentence) != std::string::npos) {
    return false;
  }
  text += kGetGrantOptionalEmailSentence;
  return true;
}

} // namespace

ResponseRewriter::ResponseRewriter(ZoneSource zone_source)
    : zone_source_(std::move(zone_source)) {}

std::string ResponseRewriter::rewrite(const std::string &method, const std::string &body) const {
  if (method == rpc::kMethodToolsList) {
    return rewrite_tool_catalog(body);
  }
  if (method == rpc::kMethodInitialize) {
    return rewrite_initialize(body);
  }
  return body;
}

std::string ResponseRewriter::rewrite_tool_catalog(const std::string &body) const {
  auto reply = common::parse_json(body);
  if (!reply.has_value()) {
    return body;
  }
  Json *result = find_result(*reply);
  if (result == nullptr) {
    return body;
  }
  Json *tool = find_tool(*result, kGetGrantTool);
  if (tool == nullptr) {
    return body;
  }

  const bool dropped = drop_required_email(*tool);
  const bool described = append_description_sentence(*tool);
  if (!dropped && !described) {
    return body;
  }
  return common::dump_json(*reply);
}

std::string timezone_guidance(const LocalZone &zone) {
  const std::string &name = zone.name;
  const std::string &abbr = zone.abbreviation;
  return std::string("\n\n") + kTimezoneGuidanceHeader + "\n" +
         "The user's local timezone is: " + name + " (" + abbr + ")\n" +
         "When displaying ANY timestamps to users (from emails, events, availability, etc.):\n" +
         "1. Always use epoch_to_datetime tool with timezone \"" + name +
         "\" to convert Unix timestamps\n" + "2. Display ALL times in " + abbr +
         ", never in UTC or the event's original timezone\n" +
         "3. Format times clearly (e.g., \"2:00 PM " + abbr + "\")";
}

std::string ResponseRewriter::rewrite_initialize(const std::string &body) const {
  auto reply = common::parse_json(body);
  if (!reply.has_value()) {
    return body;
  }
  Json *result = find_result(*reply);
  if (result == nullptr) {
    return body;
  }

  std::string instructions;
  if (const auto it = result->find("instructions"); it != result->end() && !it->is_null()) {
    if (!it->is_string()) {
      return body;
    }
    instructions = it->get<std::string>();
  }
  if (instructions.find(kTimezoneGuidanceHeader) != std::string::npos) {
    return body;
  }

  const LocalZone zone = zone_source_ ? zone_source_() : detect_local_zone();
  (*result)["instructions"] = instructions + timezone_guidance(zone);
  return common::dump_json(*reply);
}

} // namespace mcpbridge::proxy
