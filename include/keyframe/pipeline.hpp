/**
 * @file pipeline.hpp
 * @brief End-to-end keyframe extraction for one request
 *
 * @details The PipelineCoordinator composes the components:
 *
 *          1. Validate the interval (no I/O before this passes)
 *
 *          2. Acquire a staged video (download or upload)
 *
 *          3. Allocate a job directory
 *
 *          4. Run the frame extractor into it
 *
 *          5. Map frame files to <base>/frames/<job_id>/<file>
 *
 * @note The staged video is deleted on every exit path, and a job directory
 *       whose extraction failed is rolled back. Both are scoped objects, so
 *       exceptions thrown by a stage are covered as well.
 */

#ifndef KEYFRAME_PIPELINE_HPP
#define KEYFRAME_PIPELINE_HPP

#include <optional>
#include <string>

#include "artifact_store.hpp"
#include "error.hpp"
#include "frame_extractor.hpp"
#include "types.hpp"
#include "video_acquirer.hpp"

namespace keyframe {

/**
 * @class PipelineCoordinator
 * @brief Stateless orchestrator; one instance serves all requests.
 *
 * @attention JOB STATES:
 *
 *   Validating -> Acquiring -> Allocating -> Extracting
 *              -> Succeeded | RolledBack
 */
class PipelineCoordinator {
public:
  PipelineCoordinator(VideoAcquirer &acquirer, ArtifactStore &store,
                      FrameExtractor &extractor);

  /**
   * @brief Run a whole extraction job.
   * @param interval Seconds between frames, must be in [1, 60]
   * @param source Url, UploadedFile (adopted and always deleted) or None
   * @param base_url Origin for frame URLs, without trailing slash
   * @param result Output on success
   * @return InvalidInterval, NoSourceProvided, AcquisitionFailed, IOError,
   *         ExtractionFailed, or ok
   */
  Error run(int interval, const VideoSource &source,
            const std::string &base_url, ExtractionResult &result);

  /**
   * @brief Interpret the raw interval field of a request.
   * @param raw nullopt when the field is absent
   * @param interval Output: parsed value (DEFAULT_INTERVAL_SEC if absent)
   * @return InvalidInterval for present-but-malformed or out-of-range input
   */
  static Error parse_interval(const std::optional<std::string> &raw,
                              int &interval);

  static bool is_valid_interval(long long interval) {
    return interval >= MIN_INTERVAL_SEC && interval <= MAX_INTERVAL_SEC;
  }

  /// <base>/frames/<job_id>/<file name of frame_path>
  static std::string frame_url(const std::string &base_url,
                               const std::string &job_id,
                               const std::string &frame_path);

private:
  VideoAcquirer &acquirer_;
  ArtifactStore &store_;
  FrameExtractor &extractor_;
};

} // namespace keyframe

#endif // KEYFRAME_PIPELINE_HPP
