#include "mcpbridge/proxy/line_source.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace mcpbridge::proxy {

namespace {

std::optional<std::string> take_line(std::string &buffer) {
  const auto newline = buffer.find('\n');
  if (newline == std::string::npos) {
    return std::nullopt;
  }
  std::string line = buffer.substr(0, newline);
  buffer.erase(0, newline + 1);
  return line;
}

} // namespace

FdLineSource::FdLineSource(int fd, int poll_interval_ms)
    : fd_(fd), poll_interval_ms_(poll_interval_ms) {}

common::Result<std::optional<std::string>>
FdLineSource::next_line(const common::CancelSignal &cancel) {
  using R = common::Result<std::optional<std::string>>;

  while (true) {
    if (auto line = take_line(buffer_); line.has_value()) {
      return R::success(std::move(line));
    }
    if (eof_) {
      if (buffer_.empty()) {
        return R::success(std::nullopt);
      }
      std::string last = std::move(buffer_);
      buffer_.clear();
      return R::success(std::move(last));
    }
    if (cancel.stop_requested()) {
      return R::failure(cancel.reason());
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, poll_interval_ms_);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return R::failure(std::string("reading stdin: ") + std::strerror(errno));
    }
    if (ready == 0) {
      continue;
    }

    std::array<char, 4096> chunk{};
    const ssize_t n = ::read(fd_, chunk.data(), chunk.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return R::failure(std::string("reading stdin: ") + std::strerror(errno));
    }
    if (n == 0) {
      eof_ = true;
      continue;
    }
    buffer_.append(chunk.data(), static_cast<std::size_t>(n));
  }
}

StreamLineSource::StreamLineSource(std::istream &input) : input_(input) {}

common::Result<std::optional<std::string>>
StreamLineSource::next_line(const common::CancelSignal &cancel) {
  using R = common::Result<std::optional<std::string>>;
  if (cancel.stop_requested()) {
    return R::failure(cancel.reason());
  }
  std::string line;
  if (!std::getline(input_, line)) {
    if (input_.bad()) {
      return R::failure("reading input stream failed");
    }
    return R::success(std::nullopt);
  }
  return R::success(std::move(line));
}

} // namespace mcpbridge::proxy
