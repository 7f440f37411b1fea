#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace mcpbridge::observability {

struct ForwardEvent {
  std::string method;
  std::uint16_t status = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct LocalReplyEvent {
  std::string tool;
  bool found_account = false;
};

struct RequestRewriteEvent {
  std::string tool;
  std::string grant_id;
};

struct SessionCapturedEvent {
  std::string session_id;
};

struct ShutdownEvent {
  std::string reason;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ForwardEvent, LocalReplyEvent, RequestRewriteEvent,
                                   SessionCapturedEvent, ShutdownEvent, WarningEvent,
                                   ErrorEvent>;

struct UpstreamLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct RepliesWrittenMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<UpstreamLatencyMetric, RepliesWrittenMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace mcpbridge::observability
