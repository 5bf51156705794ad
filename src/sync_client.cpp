#include "sync_client.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> client_log() {
  static auto logger = category_logger("http");
  return logger;
}

nlohmann::json parse_body(const HttpResponse &response,
                          const std::string &what) {
  auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    throw ParseFailureError(what + ": response is not valid JSON");
  }
  return parsed;
}

const std::vector<std::string> kJsonHeaders = {
    "Content-Type: application/json", "Accept: application/json"};

} // namespace

SyncClient::SyncClient(std::shared_ptr<HttpClient> http, std::string api_base,
                       std::string device_id)
    : http_(std::move(http)), api_base_(std::move(api_base)),
      device_id_(std::move(device_id)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

std::string SyncClient::endpoint(const std::string &path) const {
  return api_base_ + path;
}

void SyncClient::check_status(const HttpResponse &response,
                              const std::string &what) {
  long status = response.status_code;
  if (status >= 200 && status < 300) {
    return;
  }
  switch (status) {
  case 401:
    throw HttpStatusError(status, what + ": authentication required");
  case 404:
    throw HttpStatusError(status, what + ": not found");
  case 429: {
    std::optional<long> retry_after;
    if (auto header = find_header(response.headers, "Retry-After")) {
      try {
        retry_after = std::stol(*header);
      } catch (const std::exception &) {
        // HTTP-date values are not interpreted.
      }
    }
    throw HttpStatusError(status, what + ": rate limited", retry_after);
  }
  default:
    if (status >= 500) {
      throw HttpStatusError(status, what + ": server error " +
                                        std::to_string(status));
    }
    throw HttpStatusError(status, what + ": unexpected HTTP status " +
                                      std::to_string(status));
  }
}

void SyncClient::authenticate(const CancellationToken &token) {
  if (device_id_.empty()) {
    return;
  }
  nlohmann::json body{{"device_id", device_id_}};
  auto response =
      http_->post(endpoint("/authenticate"), body.dump(), kJsonHeaders, token);
  check_status(response, "authenticate");
  auto parsed = parse_body(response, "authenticate");
  auto it = parsed.find("token");
  if (it == parsed.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw ParseFailureError("authenticate: response has no token");
  }
  std::lock_guard<std::mutex> lock(auth_mutex_);
  bearer_ = it->get<std::string>();
  client_log()->debug("Authenticated device {}", device_id_);
}

bool SyncClient::authenticated() const {
  std::lock_guard<std::mutex> lock(auth_mutex_);
  return !bearer_.empty();
}

HttpResponse SyncClient::post_sync(const std::string &body,
                                   const CancellationToken &token) {
  auto headers = kJsonHeaders;
  if (!device_id_.empty()) {
    std::lock_guard<std::mutex> lock(auth_mutex_);
    headers.push_back("Authorization: Bearer " + bearer_);
  }
  return http_->post(endpoint("/articles/sync"), body, headers, token);
}

std::vector<ArticleId> SyncClient::exchange(const std::vector<ArticleId> &seen,
                                            const CancellationToken &token) {
  if (!device_id_.empty() && !authenticated()) {
    authenticate(token);
  }
  const std::string body = nlohmann::json{{"seen_articles", seen}}.dump();
  auto response = post_sync(body, token);
  if (response.status_code == 401 && !device_id_.empty()) {
    client_log()->info("Sync token rejected; re-authenticating");
    {
      std::lock_guard<std::mutex> lock(auth_mutex_);
      bearer_.clear();
    }
    authenticate(token);
    response = post_sync(body, token);
  }
  check_status(response, "articles/sync");

  auto parsed = parse_body(response, "articles/sync");
  if (!parsed.is_object()) {
    throw ParseFailureError("articles/sync: response is not an object");
  }
  std::vector<ArticleId> unseen;
  auto it = parsed.find("unseen_articles");
  if (it == parsed.end() || it->is_null()) {
    return unseen;
  }
  if (!it->is_array()) {
    throw ParseFailureError("articles/sync: unseen_articles is not a list");
  }
  for (const auto &entry : *it) {
    if (entry.is_string()) {
      unseen.push_back(entry.get<std::string>());
    } else {
      client_log()->warn("Ignoring non-string entry in unseen_articles: {}",
                         entry.dump());
    }
  }
  client_log()->debug("Exchange sent {} seen, received {} unseen", seen.size(),
                      unseen.size());
  return unseen;
}

nlohmann::json SyncClient::fetch_article(const ArticleId &id,
                                         const CancellationToken &token) {
  if (id.rfind("https://", 0) != 0 && id.rfind("http://", 0) != 0) {
    throw NetworkFailureError("Invalid article URL: " + id);
  }
  auto response = http_->get(id, {"Accept: application/json"}, token);
  check_status(response, id);
  auto parsed = parse_body(response, id);
  if (!parsed.is_object()) {
    throw ParseFailureError(id + ": payload is not a JSON object");
  }
  return parsed;
}

} // namespace arsync
