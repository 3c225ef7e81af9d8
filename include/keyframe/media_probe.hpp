/**
 * @file media_probe.hpp
 * @brief Container/stream inspection of a staged video through libavformat
 *
 * @details Opens the file the same way the engine will, so inputs that are
 *          not videos, have no video stream, or use a codec without a
 *          decoder are rejected before a subprocess is spawned.
 */

#ifndef KEYFRAME_MEDIA_PROBE_HPP
#define KEYFRAME_MEDIA_PROBE_HPP

#include <string>

struct AVFormatContext;

namespace keyframe {

/**
 * @struct VideoInfo
 * @brief Properties of the best video stream in a container.
 */
struct VideoInfo {
  double duration = 0; //< Seconds, 0 if the container does not say
  double fps = 0;      //< Guessed frame rate
  int width = 0;
  int height = 0;
  std::string codec;     //< Decoder name, e.g. "h264"
  std::string container; //< Demuxer name, e.g. "mov,mp4,m4a,3gp,3g2,mj2"
};

/**
 * @brief Frames an fps=1/interval sampler yields for a video.
 * @note The engine may emit one frame more or less at the boundary.
 */
inline long expected_frame_count(double duration, int interval) {
  if (duration <= 0 || interval <= 0)
    return 0;
  return static_cast<long>(duration / interval);
}

/**
 * @class MediaProbe
 * @brief RAII wrapper around an opened AVFormatContext.
 */
class MediaProbe {
public:
  explicit MediaProbe(std::string path);
  ~MediaProbe();

  /// Disable copy
  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open the file and read stream information.
   * @param error Output: reason on failure
   * @return true if a decodable video stream was found
   */
  bool open(std::string &error);

  const VideoInfo &info() const { return info_; }

private:
  std::string path_;
  AVFormatContext *fmt_ctx_ = nullptr;
  VideoInfo info_;
};

} // namespace keyframe

#endif // KEYFRAME_MEDIA_PROBE_HPP
