/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "keyframe/ffmpeg_executor.hpp"

#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "keyframe/logging.hpp"
#include "keyframe/media_probe.hpp"
#include "keyframe/subprocess.hpp"
#include "keyframe/system.hpp"
#include "keyframe/types.hpp"

namespace keyframe {

namespace {

/// Last non-empty line of FFmpeg's stderr, which carries the fatal error
std::string last_line(const std::string &text) {
  size_t end = text.find_last_not_of(" \r\n\t");
  if (end == std::string::npos)
    return {};
  size_t start = text.rfind('\n', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return text.substr(start, end - start + 1);
}

} // anonymous namespace

FFmpegExecutor::FFmpegExecutor(std::string ffmpeg_path, int jpeg_quality,
                               int timeout_sec)
    : ffmpeg_path_(std::move(ffmpeg_path)), jpeg_quality_(jpeg_quality),
      timeout_sec_(timeout_sec) {}

std::vector<std::string>
FFmpegExecutor::build_command(const EngineRequest &request) const {
  std::string pattern =
      (std::filesystem::path(request.output_dir) /
       fmt::format("{}%d{}", FRAME_PREFIX, FRAME_EXTENSION))
          .string();

  return {ffmpeg_path_,
          "-nostdin",
          "-hide_banner",
          "-loglevel",
          "error",
          "-y",
          "-i",
          request.input_path,
          "-vf",
          fmt::format("fps=1/{}", request.interval),
          "-q:v",
          std::to_string(jpeg_quality_),
          pattern};
}

Error FFmpegExecutor::run(const EngineRequest &request) {
  // **----- PROBE INPUT -----**

  {
    TIMER_START(probe);
    MediaProbe probe(request.input_path);
    std::string probe_error;
    if (!probe.open(probe_error)) {
      LOG_WARN("Probe rejected {}: {}", request.input_path, probe_error);
      return Error::make(ErrorCode::EngineFailure, "Invalid input video",
                         fmt::format("FFmpeg error: {}", probe_error));
    }
    TIMER_END(probe);

    const VideoInfo &info = probe.info();
    LOG_INFO("Input: {} {}x{} @ {:.2f}fps, duration {} (~{} frames at 1/{}s)",
             info.codec, info.width, info.height, info.fps,
             format_time(info.duration),
             expected_frame_count(info.duration, request.interval),
             request.interval);
  }

  // **----- RUN FFMPEG -----**

  TIMER_START(engine_run);
  ProcessResult proc = run_process(build_command(request), timeout_sec_);
  TIMER_END(engine_run);

  if (!proc.started) {
    LOG_ERROR("Failed to start {}: {}", ffmpeg_path_, proc.spawn_error);
    return Error::make(ErrorCode::EngineFailure, "Failed to start FFmpeg",
                       fmt::format("FFmpeg error: cannot execute {}: {}",
                                   ffmpeg_path_, proc.spawn_error));
  }

  if (proc.timed_out) {
    LOG_ERROR("FFmpeg exceeded {}s on {}, killed", timeout_sec_,
              request.input_path);
    return Error::make(
        ErrorCode::EngineTimeout, "FFmpeg timed out",
        fmt::format("FFmpeg error: no result after {} seconds", timeout_sec_));
  }

  if (proc.term_signal != 0) {
    LOG_ERROR("FFmpeg terminated by signal {}", proc.term_signal);
    return Error::make(
        ErrorCode::EngineFailure, "FFmpeg crashed",
        fmt::format("FFmpeg error: terminated by signal {}", proc.term_signal));
  }

  if (proc.exit_code != 0) {
    std::string reason = last_line(proc.stderr_text);
    if (reason.empty())
      reason = fmt::format("exit status {}", proc.exit_code);
    LOG_ERROR("FFmpeg exited with error code: {} ({})", proc.exit_code, reason);
    return Error::make(ErrorCode::EngineFailure, "FFmpeg failed",
                       fmt::format("FFmpeg error: {}", reason));
  }

  return {};
}

} // namespace keyframe
