#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * Scalars that read completely as booleans or numbers keep that type,
 * everything else stays a string.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (s.empty())
      return s;
    char *end = nullptr;
    errno = 0;
    long long i = std::strtoll(s.c_str(), &end, 10);
    if (errno == 0 && end == s.c_str() + s.size())
      return i;
    errno = 0;
    double d = std::strtod(s.c_str(), &end);
    if (errno == 0 && end == s.c_str() + s.size())
      return d;
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys the loader reads.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"core", "pipeline", "reviewer", "git", "patchwork", "logging"}) {
    merge_section(section);
  }

  return normalized;
}

/// Durations are either strings such as "13m20s" or plain seconds.
std::chrono::milliseconds read_duration(const nlohmann::json &value,
                                        const char *key) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_string()) {
    try {
      return parse_duration(value.get<std::string>());
    } catch (const std::runtime_error &e) {
      throw ConfigError(std::string("Invalid duration for '") + key +
                        "': " + e.what());
    }
  }
  throw ConfigError(std::string("Expected a duration for '") + key + "'");
}

/// Commands are argv arrays; a string is split on whitespace.
std::vector<std::string> read_command(const nlohmann::json &value,
                                      const char *key) {
  if (value.is_array()) {
    return value.get<std::vector<std::string>>();
  }
  if (value.is_string()) {
    std::istringstream in(value.get<std::string>());
    return {std::istream_iterator<std::string>(in),
            std::istream_iterator<std::string>()};
  }
  throw ConfigError(std::string("Expected a command for '") + key + "'");
}

std::pair<std::string, std::string> split_category(const std::string &raw) {
  auto pos = raw.find('=');
  if (pos == std::string::npos) {
    return {raw, "debug"};
  }
  return {raw.substr(0, pos), raw.substr(pos + 1)};
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ConfigError("Configuration must be an object");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  try {
    if (cfg.contains("git_tree")) {
      set_git_tree(cfg["git_tree"].get<std::string>());
    }
    if (cfg.contains("results_path")) {
      set_results_path(cfg["results_path"].get<std::string>());
    }
    if (cfg.contains("setup_workers")) {
      set_setup_workers(cfg["setup_workers"].get<int>());
    }
    if (cfg.contains("reviewer_workers")) {
      set_reviewer_workers(cfg["reviewer_workers"].get<int>());
    }
    if (cfg.contains("reviewer_timeout")) {
      set_reviewer_timeout(
          read_duration(cfg["reviewer_timeout"], "reviewer_timeout"));
    }
    if (cfg.contains("reviewer_attempts")) {
      set_reviewer_attempts(cfg["reviewer_attempts"].get<int>());
    }
    if (cfg.contains("reviewer_command")) {
      auto argv = read_command(cfg["reviewer_command"], "reviewer_command");
      if (argv.empty()) {
        throw ConfigError("reviewer_command must not be empty");
      }
      set_reviewer_command(argv);
    }
    if (cfg.contains("prompt_dir")) {
      set_prompt_dir(cfg["prompt_dir"].get<std::string>());
    }
    if (cfg.contains("prompt_file")) {
      set_prompt_file(cfg["prompt_file"].get<std::string>());
    }
    if (cfg.contains("remote_url_template")) {
      set_remote_url_template(cfg["remote_url_template"].get<std::string>());
    }
    if (cfg.contains("indexer_command")) {
      set_indexer_command(
          read_command(cfg["indexer_command"], "indexer_command"));
    }
    if (cfg.contains("index_timeout")) {
      set_index_timeout(read_duration(cfg["index_timeout"], "index_timeout"));
    }
    if (cfg.contains("skip_index")) {
      set_skip_index(cfg["skip_index"].get<bool>());
    }
    if (cfg.contains("git_timeout")) {
      set_git_timeout(read_duration(cfg["git_timeout"], "git_timeout"));
    }
    if (cfg.contains("keep_snapshots")) {
      set_keep_snapshots(cfg["keep_snapshots"].get<bool>());
    }
    if (cfg.contains("patchwork_url")) {
      set_patchwork_url(cfg["patchwork_url"].get<std::string>());
    }
    if (cfg.contains("http_timeout")) {
      set_http_timeout(read_duration(cfg["http_timeout"], "http_timeout"));
    }
    if (cfg.contains("http_retries")) {
      set_http_retries(cfg["http_retries"].get<int>());
    }
    if (cfg.contains("log_level")) {
      set_log_level(cfg["log_level"].get<std::string>());
    }
    if (cfg.contains("log_pattern")) {
      set_log_pattern(cfg["log_pattern"].get<std::string>());
    }
    if (cfg.contains("log_file")) {
      set_log_file(cfg["log_file"].get<std::string>());
    }
    if (cfg.contains("log_rotate")) {
      set_log_rotate(cfg["log_rotate"].get<int>());
    }
    if (cfg.contains("log_compress")) {
      set_log_compress(cfg["log_compress"].get<bool>());
    }
    if (cfg.contains("log_categories")) {
      std::unordered_map<std::string, std::string> categories;
      const auto &value = cfg["log_categories"];
      auto assign_category = [&categories](std::pair<std::string, std::string>
                                               entry) {
        if (entry.first.empty()) {
          return;
        }
        if (entry.second.empty()) {
          entry.second = "debug";
        }
        categories[std::move(entry.first)] = std::move(entry.second);
      };
      if (value.is_object()) {
        for (const auto &[key, v] : value.items()) {
          if (v.is_string()) {
            assign_category({key, v.get<std::string>()});
          } else if (v.is_null()) {
            assign_category({key, "debug"});
          } else {
            config_log()->warn("Unsupported value for log category '{}'; "
                               "expected string or null",
                               key);
          }
        }
      } else if (value.is_array()) {
        for (const auto &item : value) {
          if (item.is_string()) {
            assign_category(split_category(item.get<std::string>()));
          }
        }
      } else if (value.is_string()) {
        assign_category(split_category(value.get<std::string>()));
      }
      set_log_categories(categories);
    }
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("Invalid configuration value: ") + e.what());
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown as ConfigError.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw ConfigError("Unknown config file extension: " + path);
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  config_log()->debug("Detected config file type: {}", ext);
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigError("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw ConfigError("Unsupported config format: " + ext);
    }
  } catch (const ConfigError &e) {
    config_log()->error("{}", e.what());
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigError("Failed to load config " + path + ": " + e.what());
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace prv
