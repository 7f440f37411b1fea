#pragma once

#include "mcpbridge/observability/observer.hpp"

#include <memory>

namespace mcpbridge::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_forward(const std::string &method, std::uint16_t status,
                    std::chrono::milliseconds duration, bool success);
void record_local_reply(const std::string &tool, bool found_account);
void record_request_rewrite(const std::string &tool, const std::string &grant_id);
void record_session_captured(const std::string &session_id);
void record_shutdown(const std::string &reason);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace mcpbridge::observability
