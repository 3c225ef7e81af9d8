/**
 * @file frame_extractor.cpp
 * @brief Frame extraction and ordering implementation
 */

#include "keyframe/frame_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "keyframe/logging.hpp"

namespace fs = std::filesystem;

namespace keyframe {

FrameExtractor::FrameExtractor(ExtractionEngine &engine) : engine_(engine) {}

long long FrameExtractor::frame_index(const std::string &file_name) {
  const size_t prefix_len = std::strlen(FRAME_PREFIX);
  const size_t ext_len = std::strlen(FRAME_EXTENSION);
  if (file_name.size() <= prefix_len + ext_len)
    return -1;
  if (file_name.compare(0, prefix_len, FRAME_PREFIX) != 0)
    return -1;
  if (file_name.compare(file_name.size() - ext_len, ext_len,
                        FRAME_EXTENSION) != 0)
    return -1;

  std::string digits =
      file_name.substr(prefix_len, file_name.size() - prefix_len - ext_len);
  /// 18 digits always fit in a long long
  if (digits.size() > 18)
    return -1;
  long long value = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return -1;
    value = value * 10 + (c - '0');
  }
  return value;
}

Error FrameExtractor::collect_frames(const std::string &dir,
                                     std::vector<std::string> &frames) {
  std::vector<std::pair<long long, std::string>> indexed;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return Error::make(ErrorCode::IOError, "Cannot list output directory",
                       fmt::format("{}: {}", dir, ec.message()));
  }
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec))
      continue;
    std::string name = entry.path().filename().string();
    long long index = frame_index(name);
    if (index < 0)
      continue;
    indexed.emplace_back(index, entry.path().string());
  }

  /// Numeric order, not lexicographic: frame_2 < frame_10
  std::sort(indexed.begin(), indexed.end());

  frames.clear();
  frames.reserve(indexed.size());
  for (auto &item : indexed) {
    frames.push_back(std::move(item.second));
  }
  return {};
}

Error FrameExtractor::extract(const StagedVideo &video, int interval,
                              const OutputLocation &location,
                              FrameSet &frames) {
  EngineRequest request{video.path(), location.path, interval};

  LOG_INFO("[Job {}] Running {} (1 frame / {}s)", location.job_id,
           engine_.name(), interval);

  Error err = engine_.run(request);
  if (!err.ok()) {
    return err;
  }

  FrameSet result;
  result.job_id = location.job_id;
  err = collect_frames(location.path, result.frames);
  if (!err.ok()) {
    return err;
  }

  if (result.frames.empty()) {
    LOG_WARN("[Job {}] No frames produced (video shorter than {}s?)",
             location.job_id, interval);
  }
  frames = std::move(result);
  return {};
}

} // namespace keyframe
