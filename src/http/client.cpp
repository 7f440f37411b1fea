#include "mcpbridge/http/client.hpp"

#include "mcpbridge/common/fs.hpp"

#include <curl/curl.h>

namespace mcpbridge::http {

namespace {

#ifdef MCPBRIDGE_VERSION
constexpr const char *kUserAgent = "mcpbridge/" MCPBRIDGE_VERSION;
#else
constexpr const char *kUserAgent = "mcpbridge/0.1";
#endif

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HeaderMap *>(userdata);

  // A new status line starts a new header block (redirects, 100-continue).
  if (common::starts_with(header, "HTTP/")) {
    headers->clear();
    return total;
  }

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }
  return total;
}

int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *cancel = static_cast<const common::CancelSignal *>(userdata);
  return cancel != nullptr && cancel->stop_requested() ? 1 : 0;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  const auto it = headers.find(common::to_lower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post(const std::string &url, const HeaderMap &headers,
                                  const std::string &body, const std::uint64_t timeout_ms,
                                  const common::CancelSignal *cancel) {
  HttpResponse response;
  if (cancel != nullptr && cancel->stop_requested()) {
    response.cancelled = true;
    response.network_error = true;
    response.network_error_message = cancel->reason();
    return response;
  }

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<common::CancelSignal *>(cancel));

  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.cancelled = code == CURLE_ABORTED_BY_CALLBACK;
    response.network_error_message =
        response.cancelled && cancel != nullptr ? cancel->reason() : curl_easy_strerror(code);
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace mcpbridge::http
