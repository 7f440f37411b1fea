#include "mcpbridge/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace mcpbridge::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ForwardEvent>) {
          log_line(*out_, evt.success ? "DEBUG" : "WARN",
                   "upstream.forward method=" + (evt.method.empty() ? "<raw>" : evt.method) +
                       " status=" + std::to_string(evt.status) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, LocalReplyEvent>) {
          log_line(*out_, "DEBUG",
                   "local.reply tool=" + evt.tool +
                       " found_account=" + (evt.found_account ? std::string("true")
                                                              : std::string("false")));
        } else if constexpr (std::is_same_v<T, RequestRewriteEvent>) {
          log_line(*out_, "DEBUG",
                   "request.rewrite tool=" + evt.tool + " grant_id=" + evt.grant_id);
        } else if constexpr (std::is_same_v<T, SessionCapturedEvent>) {
          log_line(*out_, "INFO", "session.captured id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, ShutdownEvent>) {
          log_line(*out_, "INFO", "proxy.shutdown reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(*out_, "WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, UpstreamLatencyMetric>) {
          log_line(*out_, "DEBUG",
                   "metric.upstream_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, RepliesWrittenMetric>) {
          log_line(*out_, "DEBUG", "metric.replies_written=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace mcpbridge::observability
