#include "mcpbridge/common/cancel.hpp"

namespace mcpbridge::common {

void CancelSignal::request_stop(const int signal_number) {
  if (stopped_.load()) {
    return;
  }
  signal_number_.store(signal_number);
  stopped_.store(true);
}

void CancelSignal::request_stop(const std::string &reason) {
  std::lock_guard<std::mutex> lock(reason_mutex_);
  if (stopped_.load()) {
    return;
  }
  reason_ = reason;
  stopped_.store(true);
}

bool CancelSignal::stop_requested() const { return stopped_.load(); }

std::string CancelSignal::reason() const {
  if (!stopped_.load()) {
    return "";
  }
  if (const int signal_number = signal_number_.load(); signal_number != 0) {
    return "received signal " + std::to_string(signal_number);
  }
  std::lock_guard<std::mutex> lock(reason_mutex_);
  return reason_.empty() ? std::string("cancelled") : reason_;
}

} // namespace mcpbridge::common
