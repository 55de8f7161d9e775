#include "reviewer.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "process.hpp"
#include "review_artifacts.hpp"
#include "review_document.hpp"
#include "util/duration.hpp"

#include <sstream>
#include <system_error>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> reviewer_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("reviewer");
  }();
  return logger;
}

std::string short_commit(const std::string &commit) {
  return commit.substr(0, 12);
}

/// Write a diagnostic file; failures only cost the diagnostic.
void write_diagnostic(const std::filesystem::path &path,
                      const std::string &content) {
  try {
    write_text_file(path, content);
  } catch (const StorageError &e) {
    reviewer_log()->warn("Could not save {}: {}", path.string(), e.what());
  }
}

} // namespace

std::string substitute_placeholders(
    const std::string &text, const std::map<std::string, std::string> &values) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto open = text.find('{', pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    auto close = text.find('}', open + 1);
    if (close == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    out.append(text, pos, open - pos);
    auto it = values.find(text.substr(open + 1, close - open - 1));
    if (it != values.end()) {
      out += it->second;
    } else {
      out.append(text, open, close - open + 1);
    }
    pos = close + 1;
  }
  return out;
}

CommandReviewer::CommandReviewer(ReviewerSettings settings)
    : settings_(std::move(settings)) {
  if (settings_.command.empty()) {
    throw ConfigError("reviewer_command must not be empty");
  }
}

std::vector<std::string>
CommandReviewer::expand_command(const ReviewJob &job,
                                const std::string &prompt) const {
  const std::map<std::string, std::string> values{
      {"workdir", job.workdir.string()},
      {"prompt", prompt},
      {"commit", job.commit},
      {"patch_dir", job.patch_dir.string()}};
  std::vector<std::string> argv;
  argv.reserve(settings_.command.size());
  for (const auto &arg : settings_.command) {
    argv.push_back(substitute_placeholders(arg, values));
  }
  return argv;
}

std::filesystem::path
CommandReviewer::install_prompt(const std::filesystem::path &workdir) const {
  if (settings_.prompt_dir.empty()) {
    return {};
  }
  auto source = settings_.prompt_dir;
  if (!source.has_filename()) {
    source = source.parent_path();
  }
  const auto target = workdir / source.filename();
  std::error_code ec;
  std::filesystem::remove_all(target, ec);
  std::filesystem::copy(source, target,
                        std::filesystem::copy_options::recursive, ec);
  if (ec) {
    throw ReviewExecutionError("Failed to copy prompt directory " +
                               source.string() + ": " + ec.message());
  }
  auto prompt = target / settings_.prompt_file;
  if (!std::filesystem::exists(prompt)) {
    reviewer_log()->warn("Prompt {} not found in {}", settings_.prompt_file,
                         target.string());
  }
  return prompt;
}

void CommandReviewer::save_partial_output(const ReviewJob &job) const {
  const auto json = job.patch_dir / review_file_name(ReviewFormat::Json);
  std::error_code ec;
  if (!std::filesystem::exists(json, ec) ||
      std::filesystem::file_size(json, ec) == 0 || ec) {
    return;
  }
  const auto partial = job.patch_dir / ("review-partial-attempt" +
                                        std::to_string(job.attempt) + ".json");
  std::filesystem::copy_file(
      json, partial, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    reviewer_log()->warn("Could not save partial output {}: {}",
                         partial.string(), ec.message());
    return;
  }
  reviewer_log()->info("Partial output saved to {}", partial.string());
}

void CommandReviewer::review(const ReviewJob &job) {
  std::error_code ec;
  std::filesystem::create_directories(job.patch_dir, ec);
  if (ec) {
    throw ReviewExecutionError("Failed to create " + job.patch_dir.string() +
                               ": " + ec.message());
  }
  const auto prompt = install_prompt(job.workdir);
  const auto json = job.patch_dir / review_file_name(ReviewFormat::Json);

  ProcessSpec spec;
  spec.argv = expand_command(job, prompt.string());
  spec.cwd = job.workdir.string();
  spec.env = settings_.env;
  spec.timeout = settings_.timeout;
  spec.stdout_path = json.string();

  reviewer_log()->info("Reviewing {} patch {} ({}) attempt {}", job.review_id,
                       job.patch_index, short_commit(job.commit), job.attempt);
  reviewer_log()->debug("Reviewer command: {}", join_command(spec.argv));
  const auto start = std::chrono::steady_clock::now();
  const auto result = run_process(spec);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  const auto attempt = std::to_string(job.attempt);

  if (result.timed_out) {
    std::ostringstream info;
    info << "Attempt: " << job.attempt << "\n"
         << "Reviewer timed out after " << format_duration(settings_.timeout)
         << "\n"
         << "Command: " << join_command(spec.argv) << "\n"
         << "Working directory: " << job.workdir.string() << "\n";
    if (!result.stderr_text.empty()) {
      info << "\nStderr output:\n" << result.stderr_text << "\n";
    }
    write_diagnostic(job.patch_dir / ("timeout-info-attempt" + attempt + ".txt"),
                     info.str());
    save_partial_output(job);
    reviewer_log()->warn("Review of {} patch {} timed out after {} (attempt {})",
                         job.review_id, job.patch_index,
                         format_duration(settings_.timeout), job.attempt);
    throw ReviewTimeoutError("Reviewer timed out after " +
                             format_duration(settings_.timeout));
  }

  if (!result.ok()) {
    write_diagnostic(job.patch_dir /
                         ("reviewer-stderr-attempt" + attempt + ".txt"),
                     result.spawn_error.empty() ? result.stderr_text
                                                : result.spawn_error);
    save_partial_output(job);
    reviewer_log()->warn("Review of {} patch {} failed after {}: {}",
                         job.review_id, job.patch_index,
                         format_duration(elapsed), describe_failure(result));
    throw ReviewExecutionError(describe_failure(result), result.exit_code);
  }

  reviewer_log()->info("Review of {} patch {} completed in {}", job.review_id,
                       job.patch_index, format_duration(elapsed));

  const auto inline_src = job.workdir / review_file_name(ReviewFormat::Inline);
  if (std::filesystem::exists(inline_src, ec)) {
    std::filesystem::copy_file(
        inline_src, job.patch_dir / review_file_name(ReviewFormat::Inline),
        std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      reviewer_log()->warn("Failed to copy {}: {}", inline_src.string(),
                           ec.message());
    }
  }

  try {
    convert_review_document(json,
                            job.patch_dir / review_file_name(ReviewFormat::Markdown));
  } catch (const std::exception &e) {
    throw ReviewExecutionError(std::string("Failed to convert review: ") +
                               e.what());
  }
}

} // namespace prv
