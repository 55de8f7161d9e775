#include "review_artifacts.hpp"

#include "errors.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace prv {

ReviewFormat parse_review_format(const std::string &name) {
  if (name == "json") {
    return ReviewFormat::Json;
  }
  if (name == "markup" || name == "md" || name == "markdown") {
    return ReviewFormat::Markdown;
  }
  if (name == "inline") {
    return ReviewFormat::Inline;
  }
  throw std::invalid_argument("Unknown review format: " + name);
}

const char *review_file_name(ReviewFormat format) {
  switch (format) {
  case ReviewFormat::Json:
    return "review.json";
  case ReviewFormat::Markdown:
    return "review.md";
  case ReviewFormat::Inline:
    return "review-inline.txt";
  }
  return "review.json";
}

std::string safe_path_component(const std::string &name) {
  std::string out;
  out.reserve(name.size());
  for (unsigned char c : name) {
    out += (std::isalnum(c) || c == '-' || c == '_' || c == '.')
               ? static_cast<char>(c)
               : '_';
  }
  if (out.empty() || out == "." || out == "..") {
    out = "_" + out;
  }
  return out;
}

void write_text_file(const std::filesystem::path &path,
                     const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw StorageError("Failed to open " + path.string() + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    throw StorageError("Failed to write " + path.string());
  }
}

std::optional<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

ReviewArtifacts::ReviewArtifacts(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path ReviewArtifacts::review_dir(const std::string &owner,
                                                  const std::string &id) const {
  return root_ / safe_path_component(owner) / safe_path_component(id);
}

std::filesystem::path ReviewArtifacts::patch_dir(const std::string &owner,
                                                 const std::string &id,
                                                 std::size_t index) const {
  return review_dir(owner, id) / std::to_string(index);
}

void ReviewArtifacts::create_review_dir(const std::string &owner,
                                        const std::string &id) const {
  std::error_code ec;
  std::filesystem::create_directories(review_dir(owner, id), ec);
  if (ec) {
    throw StorageError("Failed to create " + review_dir(owner, id).string() +
                       ": " + ec.message());
  }
}

std::filesystem::path
ReviewArtifacts::ensure_patch_dir(const std::string &owner,
                                  const std::string &id,
                                  std::size_t index) const {
  auto dir = patch_dir(owner, id, index);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw StorageError("Failed to create " + dir.string() + ": " +
                       ec.message());
  }
  return dir;
}

void ReviewArtifacts::write_message(const std::string &owner,
                                    const std::string &id,
                                    const std::string &message) const {
  create_review_dir(owner, id);
  write_text_file(review_dir(owner, id) / "message", message);
}

std::optional<std::string>
ReviewArtifacts::read_message(const std::string &owner,
                              const std::string &id) const {
  return read_text_file(review_dir(owner, id) / "message");
}

void ReviewArtifacts::write_patch_input(const std::string &owner,
                                        const std::string &id,
                                        std::size_t index,
                                        const std::string &content) const {
  write_text_file(ensure_patch_dir(owner, id, index) / "patch", content);
}

std::filesystem::path ReviewArtifacts::review_file(const std::string &owner,
                                                   const std::string &id,
                                                   std::size_t index,
                                                   ReviewFormat format) const {
  return patch_dir(owner, id, index) / review_file_name(format);
}

std::optional<std::string>
ReviewArtifacts::read_review(const std::string &owner, const std::string &id,
                             std::size_t index, ReviewFormat format) const {
  return read_text_file(review_file(owner, id, index, format));
}

std::filesystem::path
ReviewArtifacts::diagnostic_path(const std::string &owner,
                                 const std::string &id, std::size_t index,
                                 const std::string &name) const {
  return patch_dir(owner, id, index) / name;
}

} // namespace prv
