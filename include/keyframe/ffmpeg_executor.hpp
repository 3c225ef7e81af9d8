/**
 * @file ffmpeg_executor.hpp
 * @brief FFmpeg CLI implementation of the extraction engine
 *
 * @details Runs
 *
 *          ffmpeg -nostdin -hide_banner -loglevel error -y -i <input>
 *                 -vf fps=1/<interval> -q:v <quality> <out>/frame_%d.jpg
 *
 *          after probing the input with libavformat. FFmpeg's own stderr is
 *          the failure detail.
 */

#ifndef KEYFRAME_FFMPEG_EXECUTOR_HPP
#define KEYFRAME_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "extraction_engine.hpp"

namespace keyframe {

class FFmpegExecutor : public ExtractionEngine {
public:
  /**
   * @param ffmpeg_path Binary name or absolute path
   * @param jpeg_quality Value for -q:v (1 best .. 31 worst)
   * @param timeout_sec Kill FFmpeg after this many seconds (0 = never)
   */
  FFmpegExecutor(std::string ffmpeg_path, int jpeg_quality, int timeout_sec);

  Error run(const EngineRequest &request) override;

  std::string name() const override { return "ffmpeg"; }

  /**
   * @brief Full command line for a request (argv[0] first).
   */
  std::vector<std::string> build_command(const EngineRequest &request) const;

private:
  std::string ffmpeg_path_;
  int jpeg_quality_;
  int timeout_sec_;
};

} // namespace keyframe

#endif // KEYFRAME_FFMPEG_EXECUTOR_HPP
