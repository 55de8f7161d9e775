#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootName = "prv";

std::mutex g_logger_mutex;
std::weak_ptr<spdlog::logger> g_root;
std::once_flag g_pool_once;

/// Every prv logger writes here; init_logger() swaps the sinks behind it.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_sinks =
    std::make_shared<spdlog::sinks::dist_sink_mt>();

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_pool_once, [] { spdlog::init_thread_pool(32768, 1); });
  return spdlog::thread_pool();
}

/// "dir/app.log" + 2 -> "dir/app.2.log"
fs::path rotated_name(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  fs::path out = base.parent_path();
  std::string stem = base.stem().string();
  std::string ext = base.extension().string();
  if (stem.empty()) {
    stem = base.filename().string();
    ext.clear();
  }
  return out / (stem + "." + std::to_string(index) + ext);
}

bool gzip_file(const fs::path &src) {
  std::ifstream in(src, std::ios::binary);
  if (!in) {
    return false;
  }
  const std::string dst = src.string() + ".gz";
  gzFile gz = gzopen(dst.c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  std::vector<char> buf(1 << 14);
  bool ok = true;
  while (in && ok) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    auto got = in.gcount();
    if (got > 0 && gzwrite(gz, buf.data(), static_cast<unsigned>(got)) !=
                       static_cast<int>(got)) {
      ok = false;
    }
  }
  gzclose(gz);
  std::error_code ec;
  if (!ok) {
    fs::remove(dst, ec);
    return false;
  }
  in.close();
  fs::remove(src, ec);
  return true;
}

/**
 * Shift "app.N.log.gz" archives up by one, dropping the oldest, then compress
 * the freshly rotated "app.1.log".
 */
void compress_rotated(const fs::path &base, std::size_t keep) {
  std::error_code ec;
  fs::remove(rotated_name(base, keep).string() + ".gz", ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = rotated_name(base, i - 1).string() + ".gz";
    if (fs::exists(from, ec)) {
      fs::rename(from, rotated_name(base, i).string() + ".gz", ec);
    }
  }
  fs::path newest = rotated_name(base, 1);
  if (fs::exists(newest, ec) && !gzip_file(newest)) {
    // The console sink is the only safe target while the file sink reopens.
    spdlog::default_logger_raw()->warn("Failed to compress rotated log {}",
                                       newest.string());
  }
}

std::vector<spdlog::sink_ptr> make_sinks(const prv::LogSettings &settings) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (settings.file.empty()) {
    return sinks;
  }
  if (settings.rotate_files == 0) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        settings.file, false));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (settings.compress_rotations) {
    const std::size_t keep = settings.rotate_files;
    handlers.before_open = [keep](const spdlog::filename_t &name) {
      compress_rotated(fs::path(spdlog::details::os::filename_to_str(name)),
                       keep);
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      settings.file, settings.max_file_size, settings.rotate_files, false,
      handlers));
  return sinks;
}

} // namespace

namespace prv {

void init_logger(const LogSettings &settings) {
  auto pool = shared_pool();
  g_sinks->set_sinks(make_sinks(settings));
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto root = spdlog::get(kRootName);
  if (!root) {
    root = std::make_shared<spdlog::async_logger>(
        kRootName, g_sinks, pool, spdlog::async_overflow_policy::block);
    spdlog::register_logger(root);
    spdlog::set_default_logger(root);
    g_root = root;
  }
  lock.unlock();
  const std::string prefix = std::string(kRootName) + ".";
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &logger) {
    if (logger == root || logger->name().rfind(prefix, 0) == 0) {
      logger->set_level(settings.level);
    }
  });
  if (!settings.pattern.empty()) {
    spdlog::set_pattern(settings.pattern);
  }
  root->debug("Logger ready (level={}, file='{}', rotate={}, compress={})",
              spdlog::level::to_string_view(settings.level), settings.file,
              settings.rotate_files, settings.compress_rotations);
}

void ensure_default_logger() {
  auto root = g_root.lock();
  if (!root || spdlog::default_logger_raw() != root.get()) {
    init_logger(LogSettings{});
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  ensure_default_logger();
  auto pool = shared_pool();
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (auto raced = spdlog::get(name)) {
    return raced;
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      name, g_sinks, pool, spdlog::async_overflow_policy::block);
  logger->set_level(spdlog::default_logger_raw()->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->info("Applied {} category level override(s)",
                                     overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name,
                                          spdlog::level::level_enum fallback) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept that for "off" itself.
  if (level == spdlog::level::off && name != "off") {
    return fallback;
  }
  return level;
}

} // namespace prv
