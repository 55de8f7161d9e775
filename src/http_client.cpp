#include "http_client.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("patchwork");
  }();
  return logger;
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
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
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  if (!line.empty()) {
    hdrs->push_back(line);
  }
  return total;
}

} // namespace

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds timeout,
                               std::string user_agent)
    : timeout_(timeout), user_agent_(std::move(user_agent)) {}

HttpResponse
CurlHttpClient::get_with_headers(const std::string &url,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse out;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: " + user_agent_);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status_code);
  if (res != CURLE_OK) {
    std::string msg = "curl GET " + url + " failed: " +
                      (errbuf[0] ? std::string(errbuf)
                                 : std::string(curl_easy_strerror(res)));
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  if (out.status_code < 200 || out.status_code >= 300) {
    http_log()->error("curl GET {} failed with HTTP code {}", url,
                      out.status_code);
    throw HttpStatusError(static_cast<int>(out.status_code),
                          "GET " + url + " failed with HTTP code " +
                              std::to_string(out.status_code));
  }
  return out;
}

std::string CurlHttpClient::get(const std::string &url,
                                const std::vector<std::string> &headers) {
  return get_with_headers(url, headers).body;
}

RetryHttpClient::RetryHttpClient(std::unique_ptr<HttpClient> inner,
                                 int max_retries,
                                 std::chrono::milliseconds backoff)
    : inner_(std::move(inner)),
      max_retries_(std::clamp(max_retries, 0, kMaxRetries)),
      backoff_(backoff) {}

bool RetryHttpClient::is_transient(const std::exception &e) {
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return true;
  }
  if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    return http_err->status >= 500 && http_err->status < 600;
  }
  return false;
}

template <typename F>
auto RetryHttpClient::request(const std::string &url, F f) -> decltype(f()) {
  int attempt = 0;
  while (true) {
    try {
      return f();
    } catch (const std::exception &e) {
      if (attempt >= max_retries_ || !is_transient(e))
        throw;
      auto delay = backoff_ * (1 << attempt);
      http_log()->warn("GET {} failed ({}); retry {}/{} in {}ms", url,
                       e.what(), attempt + 1, max_retries_, delay.count());
      std::this_thread::sleep_for(delay);
      ++attempt;
    }
  }
}

std::string RetryHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  return request(url, [&] { return inner_->get(url, headers); });
}

HttpResponse
RetryHttpClient::get_with_headers(const std::string &url,
                                  const std::vector<std::string> &headers) {
  return request(url, [&] { return inner_->get_with_headers(url, headers); });
}

} // namespace prv
