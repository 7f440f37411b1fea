#pragma once

#include "mcpbridge/proxy/timezone.hpp"

#include <string>

namespace mcpbridge::proxy {

inline constexpr const char *kGetGrantOptionalEmailSentence =
    " If email is not provided, returns the default authenticated grant.";
inline constexpr const char *kTimezoneGuidanceHeader = "IMPORTANT - Timezone Consistency:";

/// Post-processes upstream replies by originating method. Both rewrites are
/// idempotent and return the input bytes untouched when the body does not
/// have the expected shape.
class ResponseRewriter {
public:
  explicit ResponseRewriter(ZoneSource zone_source = detect_local_zone);

  [[nodiscard]] std::string rewrite(const std::string &method, const std::string &body) const;

  /// tools/list: makes get_grant's email optional.
  [[nodiscard]] std::string rewrite_tool_catalog(const std::string &body) const;
  /// initialize: appends timezone guidance to result.instructions.
  [[nodiscard]] std::string rewrite_initialize(const std::string &body) const;

private:
  ZoneSource zone_source_;
};

/// Text appended to initialize instructions for `zone`.
[[nodiscard]] std::string timezone_guidance(const LocalZone &zone);

} // namespace mcpbridge::proxy
