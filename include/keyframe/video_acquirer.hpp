/**
 * @file video_acquirer.hpp
 * @brief Turns a VideoSource into a local, readable StagedVideo
 *
 * @details Two sources are supported:
 *
 *          - Url: streamed HTTP(S) GET into <staging>/<uuid>.mp4, bounded by
 *            a total deadline, fsync'ed before returning
 *
 *          - UploadedFile: a file the HTTP layer already wrote into the
 *            staging area (see stage_upload)
 *
 * @note The .mp4 extension of downloads is a naming convention only; FFmpeg
 *       probes the real container.
 */

#ifndef KEYFRAME_VIDEO_ACQUIRER_HPP
#define KEYFRAME_VIDEO_ACQUIRER_HPP

#include <string>

#include "error.hpp"
#include "staged_video.hpp"
#include "types.hpp"

namespace keyframe {

/**
 * @brief Split an absolute http(s) URL into origin and request target.
 * @param url e.g. "https://cdn.example.com:8443/v/clip.mp4?sig=1"
 * @param origin Output: "https://cdn.example.com:8443"
 * @param target Output: "/v/clip.mp4?sig=1" ("/" when the URL has no path)
 * @return false for other schemes or a missing host
 */
bool split_url(const std::string &url, std::string &origin,
               std::string &target);

class VideoAcquirer {
public:
  /**
   * @param staging_dir Transient area, created on demand
   * @param download_timeout_sec Budget for a whole download
   */
  VideoAcquirer(std::string staging_dir, int download_timeout_sec);

  /**
   * @brief Produce a staged video for a source.
   * @param source Url, UploadedFile or None
   * @param video Output: owned staged file on success
   * @return NoSourceProvided, DownloadFailed, UploadMissing or ok
   */
  Error acquire(const VideoSource &source, StagedVideo &video);

  /**
   * @brief Durably write upload bytes into the staging area.
   * @param content Raw file bytes from the multipart decoder
   * @param original_name Client file name, only its extension is kept
   * @param path Output: staged file path
   * @return IOError or ok
   * @note The caller hands the path back through VideoSource::from_upload.
   */
  Error stage_upload(const std::string &content,
                     const std::string &original_name, std::string &path);

private:
  std::string staging_dir_;
  int download_timeout_sec_;

  Error download(const std::string &url, StagedVideo &video);

  /// <staging>/<uuid><extension>, creating the staging dir if needed
  Error new_staging_path(const std::string &extension, std::string &path);
};

} // namespace keyframe

#endif // KEYFRAME_VIDEO_ACQUIRER_HPP
