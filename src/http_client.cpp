#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = category_logger("http");
  return logger;
}

struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  if (!line.empty()) {
    static_cast<std::vector<std::string> *>(userdata)->push_back(line);
  }
  return total;
}

/// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  const auto *token = static_cast<const CancellationToken *>(clientp);
  return token->is_cancelled() ? 1 : 0;
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       const std::string &name) {
  const std::string wanted = lowercase(name);
  for (const auto &line : headers) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (lowercase(line.substr(0, colon)) != wanted) {
      continue;
    }
    auto start = line.find_first_not_of(' ', colon + 1);
    return start == std::string::npos ? std::string() : line.substr(start);
  }
  return std::nullopt;
}

std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw NetworkFailureError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string proxy,
                               std::string user_agent)
    : timeout_ms_(timeout_ms), proxy_(std::move(proxy)),
      user_agent_(std::move(user_agent)) {}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers,
                                 const CancellationToken &token) {
  return perform("GET", url, nullptr, headers, token);
}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &body,
                                  const std::vector<std::string> &headers,
                                  const CancellationToken &token) {
  return perform("POST", url, &body, headers, token);
}

HttpResponse CurlHttpClient::perform(const char *verb, const std::string &url,
                                     const std::string *body,
                                     const std::vector<std::string> &headers,
                                     const CancellationToken &token) {
  token.throw_if_cancelled(std::string(verb) + " " + url);
  long timeout_ms = timeout_ms_;
  if (auto left = token.remaining()) {
    timeout_ms = std::min<long>(timeout_ms, static_cast<long>(left->count()));
  }
  if (timeout_ms <= 0) {
    throw NetworkTimeoutError(std::string(verb) + " " + url +
                              ": no time left for request");
  }

  CurlHandle handle;
  CURL *curl = handle.get();
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  if (!proxy_.empty()) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());
  }
  if (body != nullptr) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(body->size()));
  }
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  curl_off_t downloaded = 0;
  curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &downloaded);
  total_downloaded_ += downloaded;

  if (res == CURLE_ABORTED_BY_CALLBACK) {
    http_log()->debug("{} {} aborted by cancellation", verb, url);
    token.throw_if_cancelled(std::string(verb) + " " + url);
    throw OperationCancelledError(std::string(verb) + " " + url +
                                  ": transfer aborted");
  }
  if (res == CURLE_OPERATION_TIMEDOUT) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    http_log()->warn(msg);
    throw NetworkTimeoutError(msg);
  }
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    http_log()->warn(msg);
    throw NetworkFailureError(msg);
  }
  http_log()->trace("{} {} -> {} ({} bytes)", verb, url, response.status_code,
                    response.body.size());
  return response;
}

} // namespace arsync
