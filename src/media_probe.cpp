/**
 * @file media_probe.cpp
 * @brief libavformat based input inspection
 */

#include "keyframe/media_probe.hpp"

#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

namespace keyframe {

namespace {

std::string av_error_text(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return std::string(buf);
}

} // anonymous namespace

MediaProbe::MediaProbe(std::string path) : path_(std::move(path)) {}

MediaProbe::~MediaProbe() {
  if (fmt_ctx_)
    avformat_close_input(&fmt_ctx_);
}

bool MediaProbe::open(std::string &error) {
  int rc = avformat_open_input(&fmt_ctx_, path_.c_str(), nullptr, nullptr);
  if (rc < 0) {
    /// avformat_open_input frees the context on failure
    fmt_ctx_ = nullptr;
    error = fmt::format("Cannot open input: {}", av_error_text(rc));
    return false;
  }

  rc = avformat_find_stream_info(fmt_ctx_, nullptr);
  if (rc < 0) {
    error = fmt::format("Cannot read stream info: {}", av_error_text(rc));
    return false;
  }

  int video_idx =
      av_find_best_stream(fmt_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    error = "No video stream found";
    return false;
  }

  AVStream *stream = fmt_ctx_->streams[video_idx];
  AVCodecParameters *param = stream->codecpar;
  info_.codec = avcodec_get_name(param->codec_id);
  info_.width = param->width;
  info_.height = param->height;
  if (fmt_ctx_->iformat && fmt_ctx_->iformat->name)
    info_.container = fmt_ctx_->iformat->name;

  if (!avcodec_find_decoder(param->codec_id)) {
    error = fmt::format("Unsupported codec: {}", info_.codec);
    return false;
  }

  AVRational rate = av_guess_frame_rate(fmt_ctx_, stream, nullptr);
  info_.fps = rate.den ? av_q2d(rate) : 0.0;

  if (fmt_ctx_->duration != AV_NOPTS_VALUE) {
    info_.duration =
        static_cast<double>(fmt_ctx_->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE) {
    info_.duration = stream->duration * av_q2d(stream->time_base);
  }
  return true;
}

} // namespace keyframe
