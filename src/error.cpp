/**
 * @file error.cpp
 * @brief Error code names
 */

#include "keyframe/error.hpp"

namespace keyframe {

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::InvalidInterval:
    return "InvalidInterval";
  case ErrorCode::NoSourceProvided:
    return "NoSourceProvided";
  case ErrorCode::DownloadFailed:
    return "DownloadFailed";
  case ErrorCode::UploadMissing:
    return "UploadMissing";
  case ErrorCode::EngineFailure:
    return "EngineFailure";
  case ErrorCode::EngineTimeout:
    return "EngineTimeout";
  case ErrorCode::AcquisitionFailed:
    return "AcquisitionFailed";
  case ErrorCode::ExtractionFailed:
    return "ExtractionFailed";
  case ErrorCode::IOError:
    return "IOError";
  case ErrorCode::NotFound:
    return "NotFound";
  }
  return "Unknown";
}

} // namespace keyframe
