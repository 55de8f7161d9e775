#include "patchwork_client.hpp"

#include "errors.hpp"
#include "log.hpp"


namespace prv {

namespace {

std::shared_ptr<spdlog::logger> patchwork_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("patchwork");
  }();
  return logger;
}

const std::vector<std::string> kJsonHeaders = {"Accept: application/json"};

} // namespace

PatchworkClient::PatchworkClient(std::string base_url,
                                 std::unique_ptr<HttpClient> http)
    : base_url_(std::move(base_url)), http_(std::move(http)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string PatchworkClient::series_url(const std::string &series_id) const {
  return base_url_ + "/api/series/" + series_id + "/";
}

nlohmann::json PatchworkClient::fetch_series(const std::string &series_id) {
  const std::string url = series_url(series_id);
  std::string body;
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    body = http_->get(url, kJsonHeaders);
  } catch (const HttpStatusError &e) {
    throw PreparationError("Failed to fetch series " + series_id + ": " +
                           e.what());
  } catch (const TransientNetworkError &e) {
    throw PreparationError("Failed to fetch series " + series_id + ": " +
                           e.what());
  }
  auto doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw PreparationError("Malformed series document for " + series_id);
  }
  return doc;
}

std::string PatchworkClient::fetch_mbox(const std::string &series_id) {
  auto series = fetch_series(series_id);
  auto mbox = series.find("mbox");
  if (mbox == series.end() || !mbox->is_string() ||
      mbox->get<std::string>().empty()) {
    throw PreparationError("Series " + series_id + " has no mbox link");
  }
  if (!series.value("received_all", true)) {
    patchwork_log()->warn("Series {} is incomplete; reviewing what arrived",
                          series_id);
  }
  const std::string url = mbox->get<std::string>();
  std::string body;
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    body = http_->get(url, {});
  } catch (const HttpStatusError &e) {
    throw PreparationError("Failed to download mbox for series " + series_id +
                           ": " + e.what());
  } catch (const TransientNetworkError &e) {
    throw PreparationError("Failed to download mbox for series " + series_id +
                           ": " + e.what());
  }
  if (body.empty()) {
    throw PreparationError("Empty mbox for series " + series_id);
  }
  patchwork_log()->info("Downloaded series {} ({} bytes)", series_id,
                        body.size());
  return body;
}

std::size_t
PatchworkClient::estimate_patch_count(const std::string &series_id) {
  try {
    auto series = fetch_series(series_id);
    auto patches = series.find("patches");
    if (patches != series.end() && patches->is_array() && !patches->empty()) {
      return patches->size();
    }
  } catch (const PreparationError &e) {
    patchwork_log()->debug("Cannot estimate size of series {}: {}", series_id,
                           e.what());
  }
  return 1;
}

} // namespace prv
