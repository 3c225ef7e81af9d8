/**
 * @file subprocess.cpp
 * @brief Child process execution implementation
 */

#include "keyframe/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

/// POSIX process and pipe APIs
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "keyframe/logging.hpp"

extern char **environ;

namespace keyframe {

namespace {

/// How often a child that already closed stderr is checked for exit
constexpr std::chrono::milliseconds REAP_POLL_INTERVAL(20);

/// Append to the capture buffer, dropping the oldest bytes past the limit
void append_tail(std::string &buffer, const char *data, size_t len) {
  buffer.append(data, len);
  if (buffer.size() > STDERR_CAPTURE_LIMIT) {
    buffer.erase(0, buffer.size() - STDERR_CAPTURE_LIMIT);
  }
}

/**
 * @class SpawnSetup
 * @brief RAII holder for posix_spawn file actions and attributes.
 */
class SpawnSetup {
public:
  SpawnSetup() {
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);
  }
  ~SpawnSetup() {
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
  }
  SpawnSetup(const SpawnSetup &) = delete;
  SpawnSetup &operator=(const SpawnSetup &) = delete;

  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
};

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_sec) {
  ProcessResult result;
  if (argv.empty()) {
    result.spawn_error = "empty command line";
    return result;
  }

  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) == -1) {
    result.spawn_error = std::strerror(errno);
    return result;
  }

  pid_t pid = -1;
  {
    SpawnSetup setup;
    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null",
                                     O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&setup.actions, STDOUT_FILENO,
                                     "/dev/null", O_WRONLY, 0);
    /// dup2 clears FD_CLOEXEC on the duplicate, the originals close on exec
    posix_spawn_file_actions_adddup2(&setup.actions, pipe_fds[1],
                                     STDERR_FILENO);

    /// Own process group (for group kill) and a clean signal state: the
    /// server blocks SIGINT/SIGTERM in every thread and children inherit it
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP |
                                              POSIX_SPAWN_SETSIGMASK |
                                              POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    posix_spawnattr_setsigmask(&setup.attr, &empty_mask);
    posix_spawnattr_setsigdefault(&setup.attr, &default_signals);

    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int rc = posix_spawnp(&pid, c_argv[0], &setup.actions, &setup.attr,
                          c_argv.data(), environ);
    if (rc != 0) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      result.spawn_error = std::strerror(rc);
      return result;
    }
  }

  result.started = true;
  close(pipe_fds[1]);
  int read_fd = pipe_fds[0];

  // **---- Drain stderr until EOF or deadline ----**

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
  char buf[4096];
  bool eof = false;

  while (!eof) {
    int wait_ms = -1;
    if (timeout_sec > 0) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      deadline - std::chrono::steady_clock::now())
                      .count();
      if (left <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left);
    }

    pollfd pfd{read_fd, POLLIN, 0};
    int rc = poll(&pfd, 1, wait_ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      LOG_WARN("poll() on child stderr failed: {}", std::strerror(errno));
      break;
    }
    if (rc == 0)
      continue; //< Deadline is re-checked at the top

    ssize_t n = read(read_fd, buf, sizeof(buf));
    if (n > 0) {
      append_tail(result.stderr_text, buf, static_cast<size_t>(n));
    } else if (n == 0) {
      eof = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      eof = true;
    }
  }

  close(read_fd);

  int status = 0;
  bool reaped = false;

  /// stderr may close long before the child exits; the deadline still holds
  if (!result.timed_out && timeout_sec > 0) {
    while (true) {
      pid_t rc = waitpid(pid, &status, WNOHANG);
      if (rc == pid) {
        reaped = true;
        break;
      }
      if (rc == -1 && errno != EINTR) {
        LOG_ERROR("waitpid({}) failed: {}", pid, std::strerror(errno));
        return result;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        result.timed_out = true;
        break;
      }
      std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
  }

  if (result.timed_out) {
    kill(-pid, SIGKILL);
  }

  while (!reaped) {
    if (waitpid(pid, &status, 0) == pid) {
      reaped = true;
    } else if (errno != EINTR) {
      LOG_ERROR("waitpid({}) failed: {}", pid, std::strerror(errno));
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

} // namespace keyframe
