#include "mcpbridge/observability/global.hpp"

#include <mutex>

namespace mcpbridge::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_forward(const std::string &method, const std::uint16_t status,
                    const std::chrono::milliseconds duration, const bool success) {
  record_event(
      ForwardEvent{.method = method, .status = status, .duration = duration, .success = success});
  record_metric(UpstreamLatencyMetric{.latency = duration});
}

void record_local_reply(const std::string &tool, const bool found_account) {
  record_event(LocalReplyEvent{.tool = tool, .found_account = found_account});
}

void record_request_rewrite(const std::string &tool, const std::string &grant_id) {
  record_event(RequestRewriteEvent{.tool = tool, .grant_id = grant_id});
}

void record_session_captured(const std::string &session_id) {
  record_event(SessionCapturedEvent{.session_id = session_id});
}

void record_shutdown(const std::string &reason) { record_event(ShutdownEvent{.reason = reason}); }

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace mcpbridge::observability
