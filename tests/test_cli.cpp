#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace prv;

namespace {
CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "patchreview");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}
} // namespace

TEST_CASE("test cli", "[cli]") {
  auto opts = parse({"--verbose", "run"});
  REQUIRE(opts.verbose);
  REQUIRE(opts.command == CliCommand::Run);

  auto opts2 = parse({"run"});
  REQUIRE_FALSE(opts2.verbose);
  REQUIRE(opts2.setup_workers == 0);
  REQUIRE_FALSE(opts2.reviewer_timeout);

  auto opts3 = parse({"--config", "cfg.yaml", "--log-level", "debug",
                      "--log-file", "app.log", "--log-rotate", "5",
                      "--no-log-compress", "run"});
  REQUIRE(opts3.config_file == "cfg.yaml");
  REQUIRE(opts3.log_level == "debug");
  REQUIRE(opts3.log_file == "app.log");
  REQUIRE(opts3.log_rotate.value() == 5);
  REQUIRE(opts3.log_compress.value() == false);

  auto opts4 = parse({"-S", "2", "-R", "8", "--reviewer-timeout", "13m20s",
                      "--reviewer-attempts", "4", "--git-tree", "/srv/linux",
                      "--keep-snapshots", "--skip-index", "run"});
  REQUIRE(opts4.setup_workers == 2);
  REQUIRE(opts4.reviewer_workers == 8);
  REQUIRE(opts4.reviewer_timeout.value() == std::chrono::seconds(800));
  REQUIRE(opts4.reviewer_attempts == 4);
  REQUIRE(opts4.git_tree == "/srv/linux");
  REQUIRE(opts4.keep_snapshots);
  REQUIRE(opts4.skip_index);
}

TEST_CASE("log categories from the command line", "[cli]") {
  auto opts = parse({"--log-category", "worktree=trace", "--log-category",
                     "queue", "run"});
  REQUIRE(opts.log_categories.at("worktree") == "trace");
  REQUIRE(opts.log_categories.at("queue") == "debug");
  REQUIRE(exit_code_of({"--log-category", "=info", "run"}) != 0);
}

TEST_CASE("review subcommand", "[cli]") {
  auto opts = parse({"review", "-t", "linux", "-b", "master", "--hash",
                     "v6.1..v6.2", "--mask", "1,0,yes", "--owner", "alice",
                     "--format", "json", "--wait-timeout", "2h"});
  REQUIRE(opts.command == CliCommand::Review);
  REQUIRE(opts.review.tree == "linux");
  REQUIRE(opts.review.branch == "master");
  REQUIRE(opts.review.hash == "v6.1..v6.2");
  REQUIRE(opts.review.mask == std::vector<bool>{true, false, true});
  REQUIRE(opts.review.owner == "alice");
  REQUIRE(opts.review.format == "json");
  REQUIRE(opts.review.wait_timeout == std::chrono::hours(2));

  auto patch = std::filesystem::temp_directory_path() / "prv_cli.patch";
  {
    std::ofstream f(patch);
    f << "From: someone\n";
  }
  auto opts2 = parse({"-v", "review", "--tree", "net", "--patch",
                      patch.string(), "--patch", patch.string()});
  REQUIRE(opts2.review.patch_files.size() == 2);
  REQUIRE(opts2.review.owner == "local");
  std::filesystem::remove(patch);
}

TEST_CASE("review origin is required and exclusive", "[cli]") {
  REQUIRE(exit_code_of({"review", "-t", "linux"}) == 2);
  REQUIRE(exit_code_of({"review", "-t", "linux", "--hash", "abc", "--series",
                        "12"}) != 0);
  REQUIRE(exit_code_of({"review", "--hash", "abc"}) != 0);
  REQUIRE(exit_code_of({"review", "-t", "linux", "--hash", "abc", "--mask",
                        "1,maybe"}) != 0);
  REQUIRE(exit_code_of({"review", "-t", "linux", "--hash", "abc",
                        "--format", "pdf"}) != 0);
}

TEST_CASE("status subcommand", "[cli]") {
  auto opts = parse({"--results-path", "/srv/results", "status", "--id",
                     "abc", "--format", "markdown"});
  REQUIRE(opts.command == CliCommand::Status);
  REQUIRE(opts.results_path == "/srv/results");
  REQUIRE(opts.status.id == "abc");
  REQUIRE(opts.status.format == "markdown");

  auto opts2 = parse({"status", "--list", "--owner", "bob", "--limit", "5"});
  REQUIRE(opts2.status.list);
  REQUIRE(opts2.status.owner == "bob");
  REQUIRE(opts2.status.limit == 5);
}

TEST_CASE("subcommand is required", "[cli]") {
  REQUIRE(exit_code_of({}) != 0);
  REQUIRE(exit_code_of({"--help"}) == 0);
  REQUIRE(exit_code_of({"--version"}) == 0);
  REQUIRE(exit_code_of({"-S", "0", "run"}) != 0);
  REQUIRE(exit_code_of({"--reviewer-timeout", "later", "run"}) != 0);
}

TEST_CASE("parse mask", "[cli]") {
  REQUIRE(parse_mask("1,0,1") == std::vector<bool>{true, false, true});
  REQUIRE(parse_mask(" y, N ,true,false") ==
          std::vector<bool>{true, false, true, false});
  REQUIRE_THROWS_AS(parse_mask(""), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_mask("1,2"), std::invalid_argument);
}
