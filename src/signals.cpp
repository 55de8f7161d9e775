#include "signals.hpp"

#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <pthread.h>
#include <system_error>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> signal_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("signals");
  }();
  return logger;
}

sigset_t shutdown_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

} // namespace

void block_shutdown_signals() {
  const sigset_t set = shutdown_signals();
  const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) {
    throw std::system_error(rc, std::generic_category(),
                            "pthread_sigmask failed");
  }
}

SignalWatcher::SignalWatcher(std::function<void(int)> on_signal) {
  thread_ = std::thread([this, on_signal = std::move(on_signal)] {
    const sigset_t set = shutdown_signals();
    while (!done_.load()) {
      timespec wait{0, 200 * 1000 * 1000};
      const int sig = sigtimedwait(&set, nullptr, &wait);
      if (sig > 0) {
        signal_log()->debug("Caught signal {}", sig);
        on_signal(sig);
        return;
      }
      if (errno != EAGAIN && errno != EINTR) {
        signal_log()->error("sigtimedwait failed: {}", std::strerror(errno));
        return;
      }
    }
  });
}

SignalWatcher::~SignalWatcher() {
  done_ = true;
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace prv
