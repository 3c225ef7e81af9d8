/**
 * @file staged_video.cpp
 * @brief StagedVideo implementation
 */

#include "keyframe/staged_video.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "keyframe/logging.hpp"

namespace keyframe {

StagedVideo::StagedVideo(std::string path, bool owned)
    : path_(std::move(path)), owned_(owned) {}

StagedVideo::~StagedVideo() { reset(); }

StagedVideo::StagedVideo(StagedVideo &&other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
  other.path_.clear();
  other.owned_ = false;
}

StagedVideo &StagedVideo::operator=(StagedVideo &&other) noexcept {
  if (this != &other) {
    reset();
    path_ = std::move(other.path_);
    owned_ = other.owned_;
    other.path_.clear();
    other.owned_ = false;
  }
  return *this;
}

void StagedVideo::reset() {
  if (owned_ && !path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      LOG_WARN("Failed to cleanup {}: {}", path_, ec.message());
    }
  }
  path_.clear();
  owned_ = false;
}

std::string StagedVideo::release() {
  std::string path = std::move(path_);
  path_.clear();
  owned_ = false;
  return path;
}

} // namespace keyframe
