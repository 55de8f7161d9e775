/**
 * @file http_client.hpp
 * @brief Minimal HTTP client abstraction with a libcurl implementation.
 */
#ifndef PATCHREVIEW_HTTP_CLIENT_HPP
#define PATCHREVIEW_HTTP_CLIENT_HPP

#include <chrono>
#include <curl/curl.h>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace prv {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body.
   * @throws TransientNetworkError On transport failures.
   * @throws HttpStatusError On non-2xx responses.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP GET request returning both body and response headers.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) {
    return {get(url, headers), {}, 200};
  }
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client. Redirects are followed.
 *
 * @note This class is not thread-safe; use one instance per thread or provide
 *       external synchronization.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout Per request timeout.
   * @param user_agent Value of the User-Agent header.
   */
  explicit CurlHttpClient(
      std::chrono::milliseconds timeout = std::chrono::seconds(30),
      std::string user_agent = "patchreview");

  /// @copydoc HttpClient::get()
  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

private:
  CurlHandle curl_;
  std::chrono::milliseconds timeout_;
  std::string user_agent_;
};

/**
 * HTTP client wrapper that retries transient failures with exponential
 * backoff (base delay doubled per attempt).
 */
class RetryHttpClient : public HttpClient {
public:
  /**
   * @param inner Underlying client performing real requests.
   * @param max_retries Retries after the first attempt, at most
   *        #kMaxRetries.
   * @param backoff Base delay between attempts.
   */
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  std::chrono::milliseconds backoff);

  /// @copydoc HttpClient::get()
  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  static constexpr int kMaxRetries = 10;

  /// Whether @p e is worth retrying (transport errors and HTTP 5xx).
  static bool is_transient(const std::exception &e);

private:
  template <typename F> auto request(const std::string &url, F f)
      -> decltype(f());

  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  std::chrono::milliseconds backoff_;
};

} // namespace prv

#endif // PATCHREVIEW_HTTP_CLIENT_HPP
