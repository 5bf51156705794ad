/**
 * @file sync_client.hpp
 * @brief Client for the remote sync endpoint and article payload downloads.
 */

#ifndef ARTICLESYNC_SYNC_CLIENT_HPP
#define ARTICLESYNC_SYNC_CLIENT_HPP

#include "article.hpp"
#include "http_client.hpp"

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace arsync {

/**
 * Talks to the article server.
 *
 * The exchange call is authenticated with a bearer token obtained from
 * `POST {api_base}/authenticate` using the configured device id. A 401
 * response drops the cached token and retries once with a fresh one. With no
 * device id the exchange is sent without credentials.
 */
class SyncClient {
public:
  SyncClient(std::shared_ptr<HttpClient> http, std::string api_base,
             std::string device_id = "");

  /**
   * Send locally seen identifiers and receive the ones the server considers
   * unseen. A response without `unseen_articles` yields an empty list.
   *
   * @throws NetworkTimeoutError When @p token expires or the transport times
   *         out.
   * @throws NetworkFailureError On transport or HTTP errors.
   * @throws ParseFailureError When the response is not valid JSON.
   */
  std::vector<ArticleId> exchange(const std::vector<ArticleId> &seen,
                                  const CancellationToken &token);

  /**
   * Download the JSON payload of one article.
   *
   * @throws NetworkFailureError When @p id is not an http(s) URL or the
   *         request fails.
   * @throws ParseFailureError When the body is not a JSON object.
   */
  nlohmann::json fetch_article(const ArticleId &id,
                               const CancellationToken &token);

  /// Obtain and cache a bearer token for the configured device.
  void authenticate(const CancellationToken &token);

  bool authenticated() const;

  /// Throw HttpStatusError for any non-2xx response.
  static void check_status(const HttpResponse &response,
                           const std::string &what);

private:
  HttpResponse post_sync(const std::string &body,
                         const CancellationToken &token);
  std::string endpoint(const std::string &path) const;

  std::shared_ptr<HttpClient> http_;
  std::string api_base_;
  std::string device_id_;
  mutable std::mutex auth_mutex_;
  std::string bearer_;
};

} // namespace arsync

#endif // ARTICLESYNC_SYNC_CLIENT_HPP
