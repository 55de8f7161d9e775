#include "review_request.hpp"

#include "errors.hpp"
#include "util/ids.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <type_traits>

namespace prv {

namespace {

/// Revision expressions are handed to git as arguments.
bool is_safe_revision(const std::string &rev) {
  if (rev.empty() || rev.front() == '-') {
    return false;
  }
  return std::none_of(rev.begin(), rev.end(), [](unsigned char c) {
    return std::isspace(c) || std::iscntrl(c);
  });
}

RangeOrigin split_range(const std::string &text) {
  auto pos = text.find("..");
  if (pos == std::string::npos || text.find("..", pos + 2) != std::string::npos) {
    throw ValidationError("Range must have the form base..tip: " + text);
  }
  RangeOrigin range{text.substr(0, pos), text.substr(pos + 2)};
  if (!range.tip.empty() && range.tip.front() == '.') {
    // "a...b" is a symmetric difference, not a range we can walk in order.
    throw ValidationError("Symmetric ranges are not supported: " + text);
  }
  if (!is_safe_revision(range.base) || !is_safe_revision(range.tip)) {
    throw ValidationError("Invalid revision in range: " + text);
  }
  return range;
}

template <typename T>
std::optional<T> optional_field(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(std::string("Invalid type for '") + key +
                          "': " + e.what());
  }
}

} // namespace

std::string to_string(ReviewStatus status) {
  switch (status) {
  case ReviewStatus::Queued:
    return "queued";
  case ReviewStatus::SetupInProgress:
    return "setup-in-progress";
  case ReviewStatus::Reviewing:
    return "reviewing";
  case ReviewStatus::Done:
    return "done";
  case ReviewStatus::Error:
    return "error";
  }
  return "error";
}

std::string to_string(PatchState state) {
  switch (state) {
  case PatchState::Pending:
    return "pending";
  case PatchState::Skipped:
    return "skipped";
  case PatchState::Done:
    return "done";
  case PatchState::Error:
    return "error";
  }
  return "error";
}

ReviewStatus parse_review_status(const std::string &name) {
  if (name == "queued")
    return ReviewStatus::Queued;
  if (name == "setup-in-progress")
    return ReviewStatus::SetupInProgress;
  if (name == "reviewing")
    return ReviewStatus::Reviewing;
  if (name == "done")
    return ReviewStatus::Done;
  if (name == "error")
    return ReviewStatus::Error;
  throw std::invalid_argument("Unknown review status: " + name);
}

PatchState parse_patch_state(const std::string &name) {
  if (name == "pending")
    return PatchState::Pending;
  if (name == "skipped")
    return PatchState::Skipped;
  if (name == "done")
    return PatchState::Done;
  if (name == "error")
    return PatchState::Error;
  throw std::invalid_argument("Unknown patch state: " + name);
}

bool is_terminal(ReviewStatus status) {
  return status == ReviewStatus::Done || status == ReviewStatus::Error;
}

std::string origin_kind(const Origin &origin) {
  struct Visitor {
    std::string operator()(const CommitOrigin &) const { return "commit"; }
    std::string operator()(const RangeOrigin &) const { return "range"; }
    std::string operator()(const SeriesOrigin &) const { return "series"; }
    std::string operator()(const PatchesOrigin &) const { return "patches"; }
  };
  return std::visit(Visitor{}, origin);
}

std::string describe_origin(const Origin &origin) {
  struct Visitor {
    std::string operator()(const CommitOrigin &o) const { return o.hash; }
    std::string operator()(const RangeOrigin &o) const {
      return o.base + ".." + o.tip;
    }
    std::string operator()(const SeriesOrigin &o) const {
      return "series " + o.series_id;
    }
    std::string operator()(const PatchesOrigin &o) const {
      return std::to_string(o.bodies.size()) + " patches";
    }
  };
  return std::visit(Visitor{}, origin);
}

std::optional<std::size_t> known_patch_count(const Origin &origin) {
  if (std::holds_alternative<CommitOrigin>(origin)) {
    return 1;
  }
  if (const auto *patches = std::get_if<PatchesOrigin>(&origin)) {
    return patches->bodies.size();
  }
  return std::nullopt;
}

ReviewSubmission ReviewSubmission::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ValidationError("Submission must be a JSON object");
  }
  ReviewSubmission s;
  s.tree = optional_field<std::string>(j, "tree").value_or("");
  s.branch = optional_field<std::string>(j, "branch").value_or("");
  s.hash = optional_field<std::string>(j, "hash");
  s.range = optional_field<std::string>(j, "range");
  for (const char *key : {"series", "patchwork_series_id"}) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) {
      s.series_id = std::to_string(it->get<long long>());
    } else {
      s.series_id = optional_field<std::string>(j, key);
    }
    if (s.series_id) {
      break;
    }
  }
  s.patches = optional_field<std::vector<std::string>>(j, "patches");
  s.mask = optional_field<std::vector<bool>>(j, "mask");
  return s;
}

bool ReviewRequest::is_skipped(std::size_t index) const {
  return index >= 1 && index <= mask.size() && !mask[index - 1];
}

bool ReviewRequest::mask_matches(std::size_t patch_count) const {
  return mask.empty() || mask.size() == patch_count;
}

nlohmann::json ReviewRequest::to_json() const {
  nlohmann::json j{{"id", id},
                   {"owner", owner},
                   {"tree", tree},
                   {"branch", branch},
                   {"mask", mask},
                   {"submitted_at", submitted_at},
                   {"estimated_patches", estimated_patches},
                   {"origin", origin_kind(origin)}};
  std::visit(
      [&j](const auto &o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CommitOrigin>) {
          j["hash"] = o.hash;
        } else if constexpr (std::is_same_v<T, RangeOrigin>) {
          j["base"] = o.base;
          j["tip"] = o.tip;
        } else if constexpr (std::is_same_v<T, SeriesOrigin>) {
          j["series"] = o.series_id;
        } else {
          j["patches"] = o.bodies;
        }
      },
      origin);
  return j;
}

ReviewRequest ReviewRequest::from_json(const nlohmann::json &j) {
  try {
    ReviewRequest r;
    r.id = j.at("id").get<std::string>();
    r.owner = j.at("owner").get<std::string>();
    r.tree = j.at("tree").get<std::string>();
    r.branch = j.value("branch", "");
    r.mask = j.value("mask", std::vector<bool>{});
    r.submitted_at = j.value("submitted_at", "");
    r.estimated_patches = j.value("estimated_patches", std::size_t{1});
    const auto kind = j.at("origin").get<std::string>();
    if (kind == "commit") {
      r.origin = CommitOrigin{j.at("hash").get<std::string>()};
    } else if (kind == "range") {
      r.origin = RangeOrigin{j.at("base").get<std::string>(),
                             j.at("tip").get<std::string>()};
    } else if (kind == "series") {
      r.origin = SeriesOrigin{j.at("series").get<std::string>()};
    } else if (kind == "patches") {
      r.origin = PatchesOrigin{j.at("patches").get<std::vector<std::string>>()};
    } else {
      throw ValidationError("Unknown origin kind: " + kind);
    }
    return r;
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(std::string("Malformed request record: ") + e.what());
  }
}

bool is_valid_tree_name(const std::string &tree) {
  if (tree.empty() || tree.find("..") != std::string::npos ||
      tree.front() == '-' || tree.front() == '/' || tree.back() == '/') {
    return false;
  }
  return std::all_of(tree.begin(), tree.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '/' || c == '-';
  });
}

ReviewRequest validate_submission(const ReviewSubmission &submission,
                                  const std::string &owner) {
  const bool has_hash = submission.hash && !submission.hash->empty();
  const bool has_range = submission.range && !submission.range->empty();
  const bool has_series =
      submission.series_id && !submission.series_id->empty();
  const bool has_patches = submission.patches && !submission.patches->empty();
  const int origins = static_cast<int>(has_hash) + static_cast<int>(has_range) +
                      static_cast<int>(has_series) +
                      static_cast<int>(has_patches);
  if (origins != 1) {
    throw ValidationError(
        "Exactly one of hash, range, series or patches must be provided");
  }
  if (submission.tree.empty()) {
    throw ValidationError("tree is required");
  }
  if (!is_valid_tree_name(submission.tree)) {
    throw ValidationError("Invalid tree name: " + submission.tree);
  }
  if (!submission.branch.empty() &&
      (!is_safe_revision(submission.branch) ||
       submission.branch.find("..") != std::string::npos)) {
    throw ValidationError("Invalid branch name: " + submission.branch);
  }

  ReviewRequest request;
  request.owner = owner;
  request.tree = submission.tree;
  request.branch = submission.branch;
  if (submission.mask) {
    request.mask = *submission.mask;
  }

  if (has_hash) {
    if (submission.hash->find("..") != std::string::npos) {
      request.origin = split_range(*submission.hash);
    } else if (!is_safe_revision(*submission.hash)) {
      throw ValidationError("Invalid commit: " + *submission.hash);
    } else {
      request.origin = CommitOrigin{*submission.hash};
    }
  } else if (has_range) {
    request.origin = split_range(*submission.range);
  } else if (has_series) {
    const auto &sid = *submission.series_id;
    if (!std::all_of(sid.begin(), sid.end(), [](unsigned char c) {
          return std::isdigit(c);
        })) {
      throw ValidationError("Series id must be numeric: " + sid);
    }
    request.origin = SeriesOrigin{sid};
  } else {
    for (const auto &body : *submission.patches) {
      if (body.empty()) {
        throw ValidationError("Patch bodies must not be empty");
      }
    }
    request.origin = PatchesOrigin{*submission.patches};
  }

  if (auto count = known_patch_count(request.origin)) {
    if (!request.mask_matches(*count)) {
      throw ValidationError("Mask has " + std::to_string(request.mask.size()) +
                            " entries but the request has " +
                            std::to_string(*count) + " patches");
    }
    request.estimated_patches = *count;
  } else if (!request.mask.empty()) {
    request.estimated_patches = request.mask.size();
  }

  request.id = generate_uuid();
  request.submitted_at = now_timestamp();
  return request;
}

} // namespace prv
