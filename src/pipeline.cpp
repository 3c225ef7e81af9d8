/**
 * @file pipeline.cpp
 * @brief Extraction pipeline implementation
 *
 * @details Orchestrates one job:
 *
 *          1. Validate interval
 *
 *          2. Acquire staged video
 *
 *          3. Allocate output directory
 *
 *          4. Extract frames
 *
 *          5. Build frame URLs
 *
 * @note Log lines are prefixed with [Job <id>] once an id exists.
 */

#include "keyframe/pipeline.hpp"

#include <cctype>
#include <exception>
#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "keyframe/logging.hpp"
#include "keyframe/staged_video.hpp"

namespace keyframe {

namespace {

constexpr const char *INVALID_INTERVAL =
    "Interval must be between 1 and 60 seconds";

/**
 * @class OutputRollback
 * @brief Removes a job directory on scope exit unless committed.
 */
class OutputRollback {
public:
  OutputRollback(ArtifactStore &store, std::string job_id)
      : store_(store), job_id_(std::move(job_id)) {}

  ~OutputRollback() {
    if (committed_)
      return;
    Error err = store_.remove(job_id_);
    if (err.ok()) {
      LOG_WARN("[Job {}] RolledBack: output removed", job_id_);
    } else {
      LOG_ERROR("[Job {}] Cleanup error: {}", job_id_, err.detail);
    }
  }

  OutputRollback(const OutputRollback &) = delete;
  OutputRollback &operator=(const OutputRollback &) = delete;

  void commit() { committed_ = true; }

private:
  ArtifactStore &store_;
  std::string job_id_;
  bool committed_ = false;
};

} // anonymous namespace

PipelineCoordinator::PipelineCoordinator(VideoAcquirer &acquirer,
                                         ArtifactStore &store,
                                         FrameExtractor &extractor)
    : acquirer_(acquirer), store_(store), extractor_(extractor) {}

// **---- Request Helpers ----**

Error PipelineCoordinator::parse_interval(const std::optional<std::string> &raw,
                                          int &interval) {
  if (!raw) {
    interval = DEFAULT_INTERVAL_SEC;
    return {};
  }

  const std::string &text = *raw;
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;

  bool negative = false;
  if (begin < end && (text[begin] == '+' || text[begin] == '-')) {
    negative = text[begin] == '-';
    ++begin;
  }

  /// At most 9 digits so the value cannot overflow
  if (begin == end || end - begin > 9) {
    return Error::make(ErrorCode::InvalidInterval, INVALID_INTERVAL,
                       fmt::format("'{}' is not a valid integer", text));
  }

  long long value = 0;
  for (size_t i = begin; i < end; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return Error::make(ErrorCode::InvalidInterval, INVALID_INTERVAL,
                         fmt::format("'{}' is not a valid integer", text));
    }
    value = value * 10 + (text[i] - '0');
  }
  if (negative)
    value = -value;

  if (!is_valid_interval(value)) {
    return Error::make(ErrorCode::InvalidInterval, INVALID_INTERVAL,
                       fmt::format("got {}", value));
  }
  interval = static_cast<int>(value);
  return {};
}

std::string PipelineCoordinator::frame_url(const std::string &base_url,
                                           const std::string &job_id,
                                           const std::string &frame_path) {
  std::string name = std::filesystem::path(frame_path).filename().string();
  return fmt::format("{}/frames/{}/{}", base_url, job_id, name);
}

// **---- Main Processing ----**

Error PipelineCoordinator::run(int interval, const VideoSource &source,
                               const std::string &base_url,
                               ExtractionResult &result) {
  TIMER_START(run_extraction);

  /// An upload already sits in the staging area: own it before any return
  StagedVideo upload_guard;
  if (source.kind == VideoSource::Kind::UploadedFile && !source.value.empty()) {
    upload_guard = StagedVideo(source.value, true);
  }

  // **----- VALIDATING -----**

  if (!is_valid_interval(interval)) {
    LOG_WARN("Rejected request: interval {} out of range", interval);
    return Error::make(ErrorCode::InvalidInterval, INVALID_INTERVAL,
                       fmt::format("got {}", interval));
  }

  // **----- ACQUIRING -----**

  LOG_PHASE("Acquiring video...");
  StagedVideo staged;
  Error err = acquirer_.acquire(source, staged);
  /// From here on `staged` is the only owner of an uploaded file
  upload_guard.release();
  if (!err.ok()) {
    if (err.code == ErrorCode::NoSourceProvided) {
      LOG_WARN("Rejected request: {}", err.message);
      return err;
    }
    LOG_ERROR("Acquisition failed ({}): {}", to_string(err.code), err.detail);
    return Error::wrap(ErrorCode::AcquisitionFailed, err.message, err);
  }

  // **----- ALLOCATING -----**

  OutputLocation location;
  err = store_.allocate(location);
  if (!err.ok()) {
    LOG_ERROR("Output allocation failed: {}", err.detail);
    return err;
  }
  OutputRollback rollback(store_, location.job_id);

  // **----- EXTRACTING -----**

  LOG_PHASE("[Job {}] Extracting frames...", location.job_id);
  FrameSet frames;
  try {
    err = extractor_.extract(staged, interval, location, frames);
  } catch (const std::exception &e) {
    err = Error::make(ErrorCode::EngineFailure, "Extraction aborted",
                      e.what());
  }
  if (!err.ok()) {
    LOG_ERROR("[Job {}] Extraction failed ({}): {}", location.job_id,
              to_string(err.code), err.detail);
    return Error::wrap(ErrorCode::ExtractionFailed,
                       "Failed to extract keyframes", err);
  }

  ExtractionResult out;
  out.job_id = location.job_id;
  out.interval = interval;
  out.frame_urls.reserve(frames.frames.size());
  for (const auto &frame : frames.frames) {
    out.frame_urls.push_back(frame_url(base_url, location.job_id, frame));
  }

  rollback.commit();
  result = std::move(out);
  TIMER_END(run_extraction);

  LOG_SUCCESS("[Job {}] Succeeded: {} frames", result.job_id,
              result.frame_count());
  return {};
}

} // namespace keyframe
