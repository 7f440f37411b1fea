#include "mcpbridge/rpc/message.hpp"

#include <utility>

namespace mcpbridge::rpc {

namespace {

bool is_string_or_null(const Json &value) { return value.is_string() || value.is_null(); }

bool is_object_or_null(const Json &value) { return value.is_object() || value.is_null(); }

} // namespace

bool Request::has_argument(const std::string &key) const {
  return arguments.is_object() && arguments.contains(key);
}

std::optional<std::string> Request::string_argument(const std::string &key) const {
  if (!has_argument(key)) {
    return std::nullopt;
  }
  const auto &value = arguments.at(key);
  if (!value.is_string() || value.get_ref<const std::string &>().empty()) {
    return std::nullopt;
  }
  return value.get<std::string>();
}

Json InboundMessage::reply_id() const {
  if (!parsed.has_value()) {
    return nullptr;
  }
  return parsed->id;
}

std::optional<Request> parse_request(const std::string &line) {
  auto document = common::parse_json(line);
  if (!document.has_value() || !document->is_object()) {
    return std::nullopt;
  }

  Request request;
  const auto &root = *document;

  if (const auto it = root.find("jsonrpc"); it != root.end() && !is_string_or_null(*it)) {
    return std::nullopt;
  }
  if (const auto it = root.find("id"); it != root.end()) {
    request.id = *it;
  }
  if (const auto it = root.find("method"); it != root.end()) {
    if (!is_string_or_null(*it)) {
      return std::nullopt;
    }
    if (it->is_string()) {
      request.method = it->get<std::string>();
    }
  }

  if (const auto params = root.find("params"); params != root.end()) {
    if (!is_object_or_null(*params)) {
      return std::nullopt;
    }
    if (params->is_object()) {
      if (const auto name = params->find("name"); name != params->end()) {
        if (!is_string_or_null(*name)) {
          return std::nullopt;
        }
        if (name->is_string()) {
          request.tool_name = name->get<std::string>();
        }
      }
      if (const auto args = params->find("arguments"); args != params->end()) {
        if (!is_object_or_null(*args)) {
          return std::nullopt;
        }
        request.arguments = *args;
      }
    }
  }

  request.document = std::move(*document);
  return request;
}

InboundMessage decode_line(std::string line) {
  InboundMessage message;
  message.parsed = parse_request(line);
  message.raw = std::move(line);
  return message;
}

common::Result<std::string> serialize_request(const Request &request) {
  try {
    return common::Result<std::string>::success(request.document.dump());
  } catch (const Json::exception &ex) {
    return common::Result<std::string>::failure(std::string("encoding request: ") + ex.what());
  }
}

std::string make_success(const Json &id, Json result) {
  Json response = Json::object();
  response["jsonrpc"] = kVersion;
  response["id"] = id;
  response["result"] = std::move(result);
  return common::dump_json(response);
}

std::string make_error(const Json &id, const int code, const std::string &message) {
  Json response = Json::object();
  response["jsonrpc"] = kVersion;
  response["id"] = id;
  response["error"] = Json{{"code", code}, {"message", message}};
  return common::dump_json(response);
}

std::string make_tool_text_result(const Json &id, const std::string &text, const bool is_error) {
  Json result = Json::object();
  result["content"] = Json::array({Json{{"type", "text"}, {"text", text}}});
  if (is_error) {
    result["isError"] = true;
  }
  return make_success(id, std::move(result));
}

} // namespace mcpbridge::rpc
