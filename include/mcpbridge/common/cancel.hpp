#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace mcpbridge::common {

/// One-shot cancellation flag shared between the stdio loop, the upstream
/// transport and whoever owns the process lifetime.
///
/// `request_stop(int)` only touches lock-free atomics and may be called from a
/// signal handler. `request_stop(std::string)` is for ordinary threads.
/// The first request wins; later ones do not change the reason.
class CancelSignal {
public:
  CancelSignal() = default;
  CancelSignal(const CancelSignal &) = delete;
  CancelSignal &operator=(const CancelSignal &) = delete;

  void request_stop(int signal_number);
  void request_stop(const std::string &reason);

  [[nodiscard]] bool stop_requested() const;
  [[nodiscard]] std::string reason() const;

private:
  std::atomic<bool> stopped_{false};
  std::atomic<int> signal_number_{0};
  mutable std::mutex reason_mutex_;
  std::string reason_;
};

} // namespace mcpbridge::common
