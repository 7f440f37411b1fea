#pragma once

#include <functional>
#include <string>

namespace mcpbridge::proxy {

struct LocalZone {
  /// IANA name such as "Europe/Berlin", or the abbreviation when unknown.
  std::string name;
  /// Current abbreviation such as "CET".
  std::string abbreviation;
};

/// Called once per initialize reply so the abbreviation follows DST changes.
using ZoneSource = std::function<LocalZone()>;

/// Looks at TZ, /etc/timezone and the /etc/localtime symlink, in that order.
[[nodiscard]] LocalZone detect_local_zone();

/// Zone name from a TZ value or a zoneinfo path; empty when none can be derived.
[[nodiscard]] std::string zone_name_from_path(const std::string &value);

} // namespace mcpbridge::proxy
