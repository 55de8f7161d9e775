#include "review_document.hpp"

#include "errors.hpp"
#include "review_artifacts.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace prv {

namespace {

void append_assistant_text(const nlohmann::json &event, std::string &out) {
  auto message = event.find("message");
  if (message == event.end() || !message->is_object()) {
    return;
  }
  auto content = message->find("content");
  if (content == message->end() || !content->is_array()) {
    return;
  }
  for (const auto &item : *content) {
    if (item.is_object() && item.value("type", "") == "text") {
      auto text = item.find("text");
      if (text != item.end() && text->is_string()) {
        out += text->get<std::string>();
      }
    }
  }
}

void append_delta_text(const nlohmann::json &event, std::string &out) {
  auto delta = event.find("delta");
  if (delta == event.end() || !delta->is_object()) {
    return;
  }
  auto text = delta->find("text");
  if (text != delta->end() && text->is_string()) {
    out += text->get<std::string>();
  }
}

} // namespace

std::string extract_review_text(std::istream &in) {
  std::string out;
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    auto event = nlohmann::json::parse(line, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
      continue;
    }
    const std::string type = event.value("type", "");
    if (type == "assistant") {
      append_assistant_text(event, out);
    } else if (type == "content_block_delta") {
      append_delta_text(event, out);
    }
  }
  return out;
}

std::size_t convert_review_document(const std::filesystem::path &json_path,
                                    const std::filesystem::path &markdown_path) {
  std::ifstream in(json_path);
  if (!in) {
    throw StorageError("Failed to open reviewer output " + json_path.string());
  }
  const std::string text = extract_review_text(in);
  write_text_file(markdown_path, text);
  return text.size();
}

} // namespace prv
