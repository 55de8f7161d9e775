/**
 * @file signals.hpp
 * @brief SIGINT/SIGTERM handling for graceful shutdown.
 *
 * Shutdown signals are blocked process wide and collected by a dedicated
 * thread, so no worker or logging thread is ever interrupted by them.
 */

#ifndef PATCHREVIEW_SIGNALS_HPP
#define PATCHREVIEW_SIGNALS_HPP

#include <atomic>
#include <functional>
#include <signal.h>
#include <thread>

namespace prv {

/**
 * Block SIGINT and SIGTERM in the calling thread.
 *
 * Threads inherit the mask of the thread that creates them, so this must run
 * before any other thread exists (including the logging thread pool).
 */
void block_shutdown_signals();

/**
 * Waits for SIGINT or SIGTERM and reports the first one received.
 *
 * The signals must already be blocked with block_shutdown_signals().
 */
class SignalWatcher {
public:
  explicit SignalWatcher(std::function<void(int)> on_signal);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

private:
  std::atomic<bool> done_{false};
  std::thread thread_;
};

} // namespace prv

#endif // PATCHREVIEW_SIGNALS_HPP
