/**
 * @file types.hpp
 * @brief Core data types and constants for the keyframe service
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Interval bounds and naming constants
 *
 *          - VideoSource tagged union for the two input kinds
 *
 *          - FrameSet, OutputLocation and ExtractionResult
 */

#ifndef KEYFRAME_TYPES_HPP
#define KEYFRAME_TYPES_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace keyframe {

// **----- CONSTANTS -----**

constexpr int MIN_INTERVAL_SEC = 1;
constexpr int MAX_INTERVAL_SEC = 60;

/// Used only when the request carries no interval field at all
constexpr int DEFAULT_INTERVAL_SEC = 5;

/// Frame files are written as frame_<n>.jpg, n starting at 1
constexpr const char *FRAME_PREFIX = "frame_";
constexpr const char *FRAME_EXTENSION = ".jpg";

// **----- DATA STRUCTURES -----**

/**
 * @struct VideoSource
 * @brief Where the input video comes from.
 * @note value holds the URL for Kind::Url and a local path for
 *       Kind::UploadedFile; it is ignored for Kind::None.
 */
struct VideoSource {
  enum class Kind { None, Url, UploadedFile };

  Kind kind = Kind::None;
  std::string value;

  static VideoSource from_url(std::string url) {
    return {Kind::Url, std::move(url)};
  }
  static VideoSource from_upload(std::string path) {
    return {Kind::UploadedFile, std::move(path)};
  }
};

/**
 * @struct OutputLocation
 * @brief Per-job directory owned by the ArtifactStore.
 */
struct OutputLocation {
  std::string job_id; //< UUID, also the directory name
  std::string path;   //< <output_root>/<job_id>
};

/**
 * @struct FrameSet
 * @brief Frames produced for one job, in temporal order.
 * @note frames[0] is frame_1.jpg, the earliest sample.
 */
struct FrameSet {
  std::string job_id;
  std::vector<std::string> frames; //< Absolute or root-relative paths
};

/**
 * @struct ExtractionResult
 * @brief Successful outcome of one pipeline run.
 */
struct ExtractionResult {
  std::string job_id;
  int interval = DEFAULT_INTERVAL_SEC;
  std::vector<std::string> frame_urls;

  size_t frame_count() const { return frame_urls.size(); }
};

} // namespace keyframe

#endif // KEYFRAME_TYPES_HPP
