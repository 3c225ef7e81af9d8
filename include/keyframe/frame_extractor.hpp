/**
 * @file frame_extractor.hpp
 * @brief Runs the extraction engine for a job and orders its output
 *
 * @details After the engine succeeds, the output directory is listed and
 *          only frame_<n>.jpg files are kept, sorted by n as a number
 *          (frame_2 before frame_10), which matches temporal order.
 */

#ifndef KEYFRAME_FRAME_EXTRACTOR_HPP
#define KEYFRAME_FRAME_EXTRACTOR_HPP

#include <string>
#include <vector>

#include "error.hpp"
#include "extraction_engine.hpp"
#include "staged_video.hpp"
#include "types.hpp"

namespace keyframe {

class FrameExtractor {
public:
  explicit FrameExtractor(ExtractionEngine &engine);

  /**
   * @brief Sample one frame every `interval` seconds into `location`.
   * @param video Staged input
   * @param interval Seconds between frames
   * @param location Existing job directory
   * @param frames Output: ordered frame paths (may be empty)
   * @return EngineFailure / EngineTimeout from the engine, IOError when the
   *         directory cannot be listed, or ok
   */
  Error extract(const StagedVideo &video, int interval,
                const OutputLocation &location, FrameSet &frames);

  /**
   * @brief List frame_<n>.jpg files of a directory in index order.
   * @param dir Directory to scan
   * @param frames Output: full paths
   * @return IOError or ok
   */
  static Error collect_frames(const std::string &dir,
                              std::vector<std::string> &frames);

  /**
   * @brief Parse the index out of a frame file name.
   * @return Index, or -1 if the name does not follow frame_<n>.jpg
   */
  static long long frame_index(const std::string &file_name);

private:
  ExtractionEngine &engine_;
};

} // namespace keyframe

#endif // KEYFRAME_FRAME_EXTRACTOR_HPP
