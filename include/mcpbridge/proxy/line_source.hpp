#pragma once

#include "mcpbridge/common/cancel.hpp"
#include "mcpbridge/common/result.hpp"

#include <istream>
#include <optional>
#include <string>

namespace mcpbridge::proxy {

/// Newline-delimited input. `next_line` yields one line without its
/// terminator, nullopt at end of input, or a failure when cancelled or on a
/// read error. A final line without a trailing newline is still returned.
class LineSource {
public:
  virtual ~LineSource() = default;
  [[nodiscard]] virtual common::Result<std::optional<std::string>>
  next_line(const common::CancelSignal &cancel) = 0;
};

/// Reads a file descriptor, waking up periodically so a pending cancellation
/// interrupts the blocking read.
class FdLineSource final : public LineSource {
public:
  explicit FdLineSource(int fd, int poll_interval_ms = 100);

  [[nodiscard]] common::Result<std::optional<std::string>>
  next_line(const common::CancelSignal &cancel) override;

private:
  int fd_;
  int poll_interval_ms_;
  std::string buffer_;
  bool eof_ = false;
};

/// Reads an istream. Cancellation is only observed between lines.
class StreamLineSource final : public LineSource {
public:
  explicit StreamLineSource(std::istream &input);

  [[nodiscard]] common::Result<std::optional<std::string>>
  next_line(const common::CancelSignal &cancel) override;

private:
  std::istream &input_;
};

} // namespace mcpbridge::proxy
