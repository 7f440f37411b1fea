#include "mcpbridge/common/json.hpp"

namespace mcpbridge::common {

std::optional<Json> parse_json(const std::string &text) {
  Json parsed = Json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::string dump_json(const Json &value) {
  return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace mcpbridge::common
