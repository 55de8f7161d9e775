#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

namespace {

std::string slurp(const char *path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("file sink reaches loggers created before it") {
  const char *path = "test_patchreview.log";
  std::remove(path);

  // Category loggers may be created by static accessors before the
  // configuration is read.
  auto early = prv::category_logger("worktree");
  REQUIRE(early->level() == spdlog::level::info);

  prv::LogSettings settings;
  settings.level = spdlog::level::info;
  settings.file = path;
  settings.rotate_files = 0;
  prv::init_logger(settings);

  spdlog::debug("root debug line");
  spdlog::info("root info line");
  early->info("worktree info line");
  prv::category_logger("queue")->debug("queue debug line");
  prv::configure_log_categories({{"queue", spdlog::level::debug}});
  prv::category_logger("queue")->debug("queue override line");
  spdlog::shutdown();

  const auto content = slurp(path);
  REQUIRE(content.find("root info line") != std::string::npos);
  REQUIRE(content.find("worktree info line") != std::string::npos);
  REQUIRE(content.find("queue override line") != std::string::npos);
  REQUIRE(content.find("root debug line") == std::string::npos);
  REQUIRE(content.find("queue debug line") == std::string::npos);
  std::remove(path);
}

TEST_CASE("parse log level names") {
  using prv::parse_log_level;
  REQUIRE(parse_log_level("debug", spdlog::level::info) ==
          spdlog::level::debug);
  REQUIRE(parse_log_level("warning", spdlog::level::info) ==
          spdlog::level::warn);
  REQUIRE(parse_log_level("off", spdlog::level::info) == spdlog::level::off);
  REQUIRE(parse_log_level("chatty", spdlog::level::info) ==
          spdlog::level::info);
}
