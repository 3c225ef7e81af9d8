/**
 * @file subprocess.hpp
 * @brief Child process execution with stderr capture and a deadline
 *
 * @details Used to drive external tools (FFmpeg). The child gets /dev/null
 *          for stdin/stdout, its stderr is collected through a pipe, and it
 *          runs in its own process group so a timeout can kill the whole
 *          group.
 */

#ifndef KEYFRAME_SUBPROCESS_HPP
#define KEYFRAME_SUBPROCESS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace keyframe {

/// Only the tail of stderr is kept; tools print the fatal error last
constexpr size_t STDERR_CAPTURE_LIMIT = 16 * 1024;

/**
 * @struct ProcessResult
 * @brief Outcome of run_process().
 */
struct ProcessResult {
  bool started = false;     //< false = spawn failed, see spawn_error
  bool timed_out = false;   //< Deadline passed and the group was killed
  int exit_code = -1;       //< Exit status when the child exited normally
  int term_signal = 0;      //< Signal that terminated the child (0 = none)
  std::string spawn_error;  //< strerror() text when !started
  std::string stderr_text;  //< Captured stderr tail

  bool success() const {
    return started && !timed_out && term_signal == 0 && exit_code == 0;
  }
};

/**
 * @brief Run a program and wait for it.
 *
 * @param argv Program (looked up in PATH) followed by its arguments
 * @param timeout_sec Kill the child after this many seconds (0 = no limit)
 * @return ProcessResult describing how the child ended
 * @note Blocks the calling thread. Thread-safe: the child is started with
 *       posix_spawn, so no code runs between fork and exec.
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_sec);

} // namespace keyframe

#endif // KEYFRAME_SUBPROCESS_HPP
