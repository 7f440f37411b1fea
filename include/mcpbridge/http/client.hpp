#pragma once

#include "mcpbridge/common/cancel.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpbridge::http {

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Outcome of one HTTP exchange. `status` is 0 when no response arrived;
/// response header names are lower-cased.
struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers;
  bool timeout = false;
  bool cancelled = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] std::optional<std::string> header(const std::string &name) const;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// POSTs `body`. A non-null `cancel` aborts the transfer, including body
  /// streaming, once a stop is requested.
  [[nodiscard]] virtual HttpResponse post(const std::string &url, const HeaderMap &headers,
                                          const std::string &body, std::uint64_t timeout_ms,
                                          const common::CancelSignal *cancel) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post(const std::string &url, const HeaderMap &headers,
                                  const std::string &body, std::uint64_t timeout_ms,
                                  const common::CancelSignal *cancel) override;
};

} // namespace mcpbridge::http
