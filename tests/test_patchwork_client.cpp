#include "errors.hpp"
#include "patchwork_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <map>

using namespace prv;

namespace {

/// Serves canned bodies by URL and records every request.
class MapHttpClient : public HttpClient {
public:
  std::map<std::string, std::string> bodies;
  std::vector<std::string> requested;
  std::string get(const std::string &url,
                  const std::vector<std::string> &) override {
    requested.push_back(url);
    auto it = bodies.find(url);
    if (it == bodies.end()) {
      throw HttpStatusError(404, "not found");
    }
    return it->second;
  }
};

class ThrowTransient : public HttpClient {
public:
  int calls = 0;
  std::string get(const std::string &,
                  const std::vector<std::string> &) override {
    if (calls++ == 0)
      throw TransientNetworkError("transient");
    return "{}";
  }
};

class ThrowHttp500 : public HttpClient {
public:
  int calls = 0;
  std::string get(const std::string &,
                  const std::vector<std::string> &) override {
    if (calls++ < 2)
      throw HttpStatusError(502, "server");
    return "{}";
  }
};

class AlwaysTransient : public HttpClient {
public:
  int calls = 0;
  std::string get(const std::string &,
                  const std::vector<std::string> &) override {
    ++calls;
    throw TransientNetworkError("unreachable");
  }
};

class ThrowHttp404 : public HttpClient {
public:
  int calls = 0;
  std::string get(const std::string &,
                  const std::vector<std::string> &) override {
    ++calls;
    throw HttpStatusError(404, "missing");
  }
};

const char *kSeries = R"({
  "id": 42,
  "received_all": true,
  "mbox": "https://pw.example.org/series/42/mbox/",
  "patches": [{"id": 1}, {"id": 2}, {"id": 3}]
})";

} // namespace

TEST_CASE("retry typed errors") {
  {
    auto http = std::make_unique<ThrowTransient>();
    auto *raw = http.get();
    RetryHttpClient client(std::move(http), 3, std::chrono::milliseconds(1));
    REQUIRE(client.get("http://x", {}) == "{}");
    REQUIRE(raw->calls == 2);
  }
  {
    auto http = std::make_unique<ThrowHttp500>();
    auto *raw = http.get();
    RetryHttpClient client(std::move(http), 3, std::chrono::milliseconds(1));
    REQUIRE(client.get("http://x", {}) == "{}");
    REQUIRE(raw->calls == 3);
  }
  {
    auto http = std::make_unique<ThrowHttp404>();
    auto *raw = http.get();
    RetryHttpClient client(std::move(http), 3, std::chrono::milliseconds(1));
    REQUIRE_THROWS_AS(client.get("http://x", {}), HttpStatusError);
    REQUIRE(raw->calls == 1);
  }
  {
    auto http = std::make_unique<ThrowHttp500>();
    auto *raw = http.get();
    RetryHttpClient client(std::move(http), 1, std::chrono::milliseconds(1));
    REQUIRE_THROWS_AS(client.get("http://x", {}), HttpStatusError);
    REQUIRE(raw->calls == 2);
  }
}

TEST_CASE("retry count is capped") {
  auto http = std::make_unique<AlwaysTransient>();
  auto *raw = http.get();
  RetryHttpClient client(std::move(http), 40, std::chrono::milliseconds(0));
  REQUIRE_THROWS_AS(client.get("http://x", {}), TransientNetworkError);
  REQUIRE(raw->calls == RetryHttpClient::kMaxRetries + 1);
}

TEST_CASE("patchwork series is downloaded through its mbox link") {
  auto http = std::make_unique<MapHttpClient>();
  auto *raw = http.get();
  raw->bodies["https://pw.example.org/api/series/42/"] = kSeries;
  raw->bodies["https://pw.example.org/series/42/mbox/"] = "From 1\nFrom 2\n";
  PatchworkClient client("https://pw.example.org/", std::move(http));
  REQUIRE(client.series_url("42") == "https://pw.example.org/api/series/42/");
  REQUIRE(client.fetch_mbox("42") == "From 1\nFrom 2\n");
  REQUIRE(raw->requested.size() == 2);
  REQUIRE(client.estimate_patch_count("42") == 3);
}

TEST_CASE("patchwork failures become preparation errors") {
  auto http = std::make_unique<MapHttpClient>();
  auto *raw = http.get();
  raw->bodies["https://pw.example.org/api/series/7/"] = R"({"id": 7})";
  raw->bodies["https://pw.example.org/api/series/8/"] = "<html>";
  PatchworkClient client("https://pw.example.org", std::move(http));
  REQUIRE_THROWS_AS(client.fetch_mbox("7"), PreparationError);
  REQUIRE_THROWS_AS(client.fetch_mbox("8"), PreparationError);
  REQUIRE_THROWS_AS(client.fetch_mbox("9"), PreparationError);
  REQUIRE(client.estimate_patch_count("9") == 1);
  REQUIRE(client.estimate_patch_count("7") == 1);
}
