#include "errors.hpp"
#include "review_artifacts.hpp"
#include "review_document.hpp"
#include "util/ids.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <sstream>

using namespace prv;

TEST_CASE("assistant text blocks are concatenated") {
  std::istringstream in(
      R"({"type":"system","subtype":"init"})"
      "\n"
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"# Review\n"},{"type":"tool_use","name":"Read"}]}})"
      "\n"
      "\n"
      "not json at all\n"
      R"({"type":"content_block_delta","delta":{"type":"text_delta","text":"Looks good."}})"
      "\n"
      R"({"type":"result","result":"ignored"})"
      "\n");
  REQUIRE(extract_review_text(in) == "# Review\nLooks good.");
}

TEST_CASE("malformed events are skipped") {
  std::istringstream in(R"({"type":"assistant","message":"plain"})"
                        "\n"
                        R"({"type":"assistant","message":{"content":"x"}})"
                        "\n"
                        R"([1,2,3])"
                        "\n");
  REQUIRE(extract_review_text(in).empty());
}

TEST_CASE("review document is converted to markdown") {
  auto dir = std::filesystem::temp_directory_path() /
             ("prv_doc_" + generate_uuid());
  std::filesystem::create_directories(dir);
  write_text_file(dir / "review.json",
                  R"({"type":"assistant","message":{"content":[{"type":"text","text":"No issues found."}]}})"
                  "\n");
  auto written = convert_review_document(dir / "review.json", dir / "review.md");
  REQUIRE(written == 16);
  REQUIRE(read_text_file(dir / "review.md").value() == "No issues found.");

  REQUIRE_THROWS_AS(
      convert_review_document(dir / "missing.json", dir / "other.md"),
      StorageError);
  std::filesystem::remove_all(dir);
}

TEST_CASE("artifact layout") {
  ReviewArtifacts artifacts("/srv/results");
  REQUIRE(artifacts.patch_dir("alice", "id-1", 3) ==
          std::filesystem::path("/srv/results/alice/id-1/3"));
  REQUIRE(artifacts.review_file("alice", "id-1", 2, ReviewFormat::Markdown) ==
          std::filesystem::path("/srv/results/alice/id-1/2/review.md"));
  REQUIRE(parse_review_format("markup") == ReviewFormat::Markdown);
  REQUIRE(parse_review_format("inline") == ReviewFormat::Inline);
  REQUIRE(std::string(review_file_name(ReviewFormat::Json)) == "review.json");
  REQUIRE_THROWS_AS(parse_review_format("pdf"), std::invalid_argument);
  REQUIRE(safe_path_component("../etc") != "../etc");
}

TEST_CASE("artifacts round trip through the filesystem") {
  auto root = std::filesystem::temp_directory_path() /
              ("prv_art_" + generate_uuid());
  ReviewArtifacts artifacts(root);
  artifacts.create_review_dir("bob", "r1");
  REQUIRE_FALSE(artifacts.read_message("bob", "r1"));
  artifacts.write_message("bob", "r1", "could not apply");
  REQUIRE(artifacts.read_message("bob", "r1").value() == "could not apply");
  artifacts.write_patch_input("bob", "r1", 1, "From: x\n");
  REQUIRE(read_text_file(artifacts.patch_dir("bob", "r1", 1) / "patch")
              .value() == "From: x\n");
  REQUIRE_FALSE(artifacts.read_review("bob", "r1", 1, ReviewFormat::Json));
  std::filesystem::remove_all(root);
}
