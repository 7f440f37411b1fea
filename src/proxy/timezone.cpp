#include "mcpbridge/proxy/timezone.hpp"

#include "mcpbridge/common/fs.hpp"

#include <array>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace mcpbridge::proxy {

namespace {

std::string current_abbreviation() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  if (localtime_r(&now, &local) == nullptr) {
    return "UTC";
  }
  std::array<char, 64> buffer{};
  const auto written = std::strftime(buffer.data(), buffer.size(), "%Z", &local);
  if (written == 0) {
    return "UTC";
  }
  return std::string(buffer.data(), written);
}

std::string zone_from_etc_timezone() {
  std::ifstream file("/etc/timezone");
  std::string line;
  if (file && std::getline(file, line)) {
    return common::trim(line);
  }
  return "";
}

std::string zone_from_localtime_link() {
  std::error_code ec;
  const auto target = std::filesystem::read_symlink("/etc/localtime", ec);
  if (ec) {
    return "";
  }
  return zone_name_from_path(target.string());
}

} // namespace

std::string zone_name_from_path(const std::string &value) {
  std::string zone = common::trim(value);
  if (!zone.empty() && zone.front() == ':') {
    zone.erase(zone.begin());
  }
  const std::string marker = "zoneinfo/";
  if (const auto pos = zone.find(marker); pos != std::string::npos) {
    return zone.substr(pos + marker.size());
  }
  if (zone.empty() || zone.front() == '/') {
    return "";
  }
  return zone;
}

LocalZone detect_local_zone() {
  LocalZone zone;
  zone.abbreviation = current_abbreviation();

  if (const char *tz = std::getenv("TZ"); tz != nullptr && *tz != '\0') {
    zone.name = zone_name_from_path(tz);
  }
  if (zone.name.empty()) {
    zone.name = zone_from_etc_timezone();
  }
  if (zone.name.empty()) {
    zone.name = zone_from_localtime_link();
  }
  if (zone.name.empty()) {
    zone.name = zone.abbreviation;
  }
  return zone;
}

} // namespace mcpbridge::proxy
