/**
 * @file patchwork_client.hpp
 * @brief Resolution of external patch series identifiers.
 */
#ifndef PATCHREVIEW_PATCHWORK_CLIENT_HPP
#define PATCHREVIEW_PATCHWORK_CLIENT_HPP

#include "http_client.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace prv {

/** Source of patch series addressed by an identifier. */
class SeriesSource {
public:
  virtual ~SeriesSource() = default;

  /**
   * Download the series as a single mbox.
   *
   * @throws PreparationError when the series cannot be retrieved.
   */
  virtual std::string fetch_mbox(const std::string &series_id) = 0;

  /**
   * Number of patches in the series, used for queue position estimates.
   *
   * @return Patch count, or 1 when it cannot be determined.
   */
  virtual std::size_t estimate_patch_count(const std::string &series_id) = 0;
};

/**
 * Patchwork REST API client.
 *
 * Series metadata is read from `<base>/api/series/<id>/`; its `mbox` link is
 * then downloaded. Requests are serialized because the underlying curl
 * handle is not thread-safe.
 */
class PatchworkClient : public SeriesSource {
public:
  /**
   * @param base_url Patchwork instance, e.g. "https://patchwork.kernel.org".
   * @param http Transport; typically a RetryHttpClient around CurlHttpClient.
   */
  PatchworkClient(std::string base_url, std::unique_ptr<HttpClient> http);

  std::string fetch_mbox(const std::string &series_id) override;
  std::size_t estimate_patch_count(const std::string &series_id) override;

  /// URL of the series metadata document.
  std::string series_url(const std::string &series_id) const;

private:
  nlohmann::json fetch_series(const std::string &series_id);

  std::string base_url_;
  std::unique_ptr<HttpClient> http_;
  std::mutex mutex_;
};

} // namespace prv

#endif // PATCHREVIEW_PATCHWORK_CLIENT_HPP
