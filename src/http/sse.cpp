#include "mcpbridge/http/sse.hpp"

#include "mcpbridge/common/fs.hpp"

#include <sstream>

namespace mcpbridge::http {

std::vector<std::string> extract_sse_data_lines(const std::string &body) {
  std::vector<std::string> payloads;
  std::istringstream lines(body);
  std::string line;

  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!common::starts_with(line, "data:")) {
      continue;
    }
    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
      payload.erase(payload.begin());
    }
    if (!payload.empty()) {
      payloads.push_back(std::move(payload));
    }
  }
  return payloads;
}

bool is_event_stream(const std::string &content_type) {
  return common::starts_with(common::to_lower(common::trim(content_type)), "text/event-stream");
}

} // namespace mcpbridge::http
