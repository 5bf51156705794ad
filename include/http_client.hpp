/**
 * @file http_client.hpp
 * @brief Cancellable HTTP transport used for the sync exchange and article
 * downloads.
 */

#ifndef ARTICLESYNC_HTTP_CLIENT_HPP
#define ARTICLESYNC_HTTP_CLIENT_HPP

#include "cancellation.hpp"

#include <atomic>
#include <curl/curl.h>
#include <optional>
#include <string>
#include <vector>

namespace arsync {

/// Completed HTTP exchange. Non-2xx statuses are returned, not thrown.
struct HttpResponse {
  std::string body;
  std::vector<std::string> headers;
  long status_code = 0;
};

/// Case-insensitive lookup of a response header value.
std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       const std::string &name);

/**
 * Minimal HTTP interface. Implementations honour @p token: a cancelled token
 * aborts the transfer with OperationCancelledError and an expired deadline
 * with NetworkTimeoutError. Transport errors raise NetworkFailureError.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers,
                           const CancellationToken &token) = 0;

  virtual HttpResponse post(const std::string &url, const std::string &body,
                            const std::vector<std::string> &headers,
                            const CancellationToken &token) = 0;
};

/// RAII wrapper for a CURL easy handle; global init happens once.
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * libcurl implementation. Every request uses its own easy handle, so one
 * instance can be shared by concurrent workers.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Ceiling for one request; a shorter token deadline wins.
   * @param proxy Optional proxy URL applied to every request.
   * @param user_agent Value of the User-Agent header.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string proxy = "",
                          std::string user_agent = "articlesync");

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers,
                   const CancellationToken &token) override;

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers,
                    const CancellationToken &token) override;

  /// Bytes received across all requests.
  curl_off_t total_downloaded() const { return total_downloaded_.load(); }

private:
  HttpResponse perform(const char *verb, const std::string &url,
                       const std::string *body,
                       const std::vector<std::string> &headers,
                       const CancellationToken &token);

  long timeout_ms_;
  std::string proxy_;
  std::string user_agent_;
  std::atomic<curl_off_t> total_downloaded_{0};
};

/// Human readable description of a failed CURL transfer.
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf);

} // namespace arsync

#endif // ARTICLESYNC_HTTP_CLIENT_HPP
