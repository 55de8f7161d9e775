#include "util/duration.hpp"

#include <cctype>
#include <stdexcept>

namespace prv {

std::chrono::milliseconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::milliseconds{0};
  }

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string: " + str);
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
      total += value * 1000; // plain seconds
      break;
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    switch (unit) {
    case 's':
      total += value * 1000;
      break;
    case 'm':
      if (i < str.size() &&
          std::tolower(static_cast<unsigned char>(str[i])) == 's') {
        ++i;
        total += value;
      } else {
        total += value * 60 * 1000;
      }
      break;
    case 'h':
      total += value * 3600 * 1000;
      break;
    case 'd':
      total += value * 86400 * 1000;
      break;
    default:
      throw std::runtime_error("Invalid duration suffix: " + str);
    }
    has_unit = true;
  }

  return std::chrono::milliseconds{total};
}

std::string format_duration(std::chrono::milliseconds value) {
  long long ms = value.count();
  if (ms == 0) {
    return "0s";
  }
  std::string out;
  if (ms < 0) {
    out += '-';
    ms = -ms;
  }
  const long long hours = ms / 3600000;
  ms %= 3600000;
  const long long minutes = ms / 60000;
  ms %= 60000;
  const long long seconds = ms / 1000;
  ms %= 1000;
  if (hours > 0) {
    out += std::to_string(hours) + "h";
  }
  if (minutes > 0) {
    out += std::to_string(minutes) + "m";
  }
  if (seconds > 0) {
    out += std::to_string(seconds) + "s";
  }
  if (ms > 0) {
    out += std::to_string(ms) + "ms";
  }
  return out;
}

} // namespace prv
