#include "process.hpp"

#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0) {
    return;
  }
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void write_all(int fd, const char *text) {
  std::size_t left = std::strlen(text);
  while (left > 0) {
    ssize_t n = ::write(fd, text, left);
    if (n <= 0) {
      return;
    }
    text += n;
    left -= static_cast<std::size_t>(n);
  }
}

/// Report errno from the child through the status pipe and exit.
[[noreturn]] void child_fail(int status_fd, const char *what) {
  const char *reason = std::strerror(errno);
  write_all(status_fd, what);
  write_all(status_fd, ": ");
  write_all(status_fd, reason);
  _exit(127);
}

/// Inherited environment with @p overrides applied, as "KEY=value" entries.
std::vector<std::string>
merged_environment(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> out;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string item(*entry);
    if (overrides.count(item.substr(0, item.find('='))) == 0) {
      out.push_back(std::move(item));
    }
  }
  for (const auto &[key, value] : overrides) {
    out.push_back(key + "=" + value);
  }
  return out;
}

int exit_code_from_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::string join_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    if (arg.find_first_of(" \t\"'") != std::string::npos) {
      out += '\'' + arg + '\'';
    } else {
      out += arg;
    }
  }
  return out;
}

std::string describe_failure(const ProcessResult &result) {
  if (!result.spawn_error.empty()) {
    return result.spawn_error;
  }
  if (result.timed_out) {
    return "timed out";
  }
  std::string text = result.stderr_text;
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    text = result.stdout_text;
  }
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  if (text.empty()) {
    return "exit code " + std::to_string(result.exit_code);
  }
  return text;
}

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  if (spec.argv.empty()) {
    result.spawn_error = "empty command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    result.spawn_error = std::string("pipe: ") + std::strerror(errno);
    for (int *fds : {out_pipe, err_pipe, status_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return result;
  }

  // Everything the child needs is built before fork(); it only makes
  // async-signal-safe calls afterwards.
  std::vector<std::string> args = spec.argv;
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);
  std::vector<std::string> env_strings = merged_environment(spec.env);
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &e : env_strings) {
    envp.push_back(e.data());
  }
  envp.push_back(nullptr);

  process_log()->debug("Running {} (cwd='{}', timeout={}ms)",
                       join_command(spec.argv), spec.cwd,
                       spec.timeout.count());

  pid_t pid = ::fork();
  if (pid < 0) {
    result.spawn_error = std::string("fork: ") + std::strerror(errno);
    for (int *fds : {out_pipe, err_pipe, status_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return result;
  }

  if (pid == 0) {
    ::setsid();
    // Signal masks survive exec; the child starts with none blocked.
    sigset_t unblocked;
    sigemptyset(&unblocked);
    ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);
    int in_fd = ::open(spec.stdin_path.empty() ? "/dev/null"
                                               : spec.stdin_path.c_str(),
                       O_RDONLY);
    if (in_fd < 0) {
      child_fail(status_pipe[1], "open stdin");
    }
    ::dup2(in_fd, STDIN_FILENO);
    if (!spec.stdout_path.empty()) {
      int fd = ::open(spec.stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                      0644);
      if (fd < 0) {
        child_fail(status_pipe[1], "open stdout file");
      }
      ::dup2(fd, STDOUT_FILENO);
    } else {
      ::dup2(out_pipe[1], STDOUT_FILENO);
    }
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      child_fail(status_pipe[1], "chdir");
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    child_fail(status_pipe[1], argv[0]);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  const bool has_deadline = spec.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
  char buf[4096];
  int status = 0;
  bool reaped = false;

  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    int wait_ms = -1;
    if (has_deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left.count(), 1000));
    }
    pollfd fds[2];
    nfds_t nfds = 0;
    for (int fd : {out_pipe[0], err_pipe[0]}) {
      if (fd >= 0) {
        fds[nfds++] = pollfd{fd, POLLIN, 0};
      }
    }
    int rc = ::poll(fds, nfds, wait_ms);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    for (nfds_t i = 0; i < nfds; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (fds[i].fd == out_pipe[0]) {
        if (n <= 0) {
          close_fd(out_pipe[0]);
        } else {
          append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                         result.stdout_truncated);
        }
      } else {
        if (n <= 0) {
          close_fd(err_pipe[0]);
        } else {
          append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                         result.stderr_truncated);
        }
      }
    }
  }

  if (!result.timed_out && has_deadline) {
    // Streams closed; the process may still be running after closing them.
    while (!reaped) {
      pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid) {
        reaped = true;
        break;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        result.timed_out = true;
        break;
      }
      ::usleep(10000);
    }
  }

  if (result.timed_out) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
  }
  while (!reaped) {
    if (::waitpid(pid, &status, 0) == pid || errno != EINTR) {
      reaped = true;
    }
  }
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  std::string child_error;
  ssize_t n = 0;
  while ((n = ::read(status_pipe[0], buf, sizeof(buf))) > 0) {
    child_error.append(buf, static_cast<std::size_t>(n));
  }
  close_fd(status_pipe[0]);

  if (!child_error.empty()) {
    result.spawn_error = child_error;
    result.exit_code = 127;
    process_log()->warn("Failed to start {}: {}", join_command(spec.argv),
                        child_error);
    return result;
  }
  if (result.timed_out) {
    result.exit_code = 124;
    process_log()->warn("{} timed out after {}ms", join_command(spec.argv),
                        spec.timeout.count());
  } else {
    result.exit_code = exit_code_from_status(status);
  }
  if (result.stdout_truncated) {
    result.stdout_text += "(truncated)";
  }
  if (result.stderr_truncated) {
    result.stderr_text += "(truncated)";
  }
  return result;
}

} // namespace prv
