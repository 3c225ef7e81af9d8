/**
 * @file staged_video.hpp
 * @brief Scoped ownership of a transient input video
 *
 * @details A StagedVideo is the local copy of the input a job works on,
 *          whether it was downloaded or uploaded. When it owns the file, the
 *          file is deleted as soon as the object goes away: on normal return,
 *          on an error return, and during stack unwinding.
 */

#ifndef KEYFRAME_STAGED_VIDEO_HPP
#define KEYFRAME_STAGED_VIDEO_HPP

#include <string>

namespace keyframe {

/**
 * @class StagedVideo
 * @brief RAII wrapper for a staged input file.
 * @note Supports move semantics but not copy. Deletion failures are logged
 *       and never raised.
 */
class StagedVideo {
public:
  StagedVideo() = default;
  StagedVideo(std::string path, bool owned);
  ~StagedVideo();

  /// Disable copy
  StagedVideo(const StagedVideo &) = delete;
  StagedVideo &operator=(const StagedVideo &) = delete;

  /// Enable move
  StagedVideo(StagedVideo &&other) noexcept;
  StagedVideo &operator=(StagedVideo &&other) noexcept;

  const std::string &path() const { return path_; }
  bool owned() const { return owned_; }
  bool empty() const { return path_.empty(); }

  /**
   * @brief Delete the file now if owned, then forget it.
   */
  void reset();

  /**
   * @brief Give up ownership without deleting.
   * @return The path that was held
   */
  std::string release();

private:
  std::string path_;
  bool owned_ = false;
};

} // namespace keyframe

#endif // KEYFRAME_STAGED_VIDEO_HPP
