/**
 * @file error.hpp
 * @brief Error codes and the Error value passed between components
 *
 * @details Fallible operations return an Error and write their product
 *          through an out-parameter. A default-constructed Error means
 *          success. Coordinator-level errors keep the code of the component
 *          failure that caused them in `cause`.
 */

#ifndef KEYFRAME_ERROR_HPP
#define KEYFRAME_ERROR_HPP

#include <string>

namespace keyframe {

enum class ErrorCode {
  None,
  InvalidInterval,   //< Client error, nothing touched yet
  NoSourceProvided,  //< Client error
  DownloadFailed,    //< Network fault, non-2xx, timeout
  UploadMissing,     //< Staged upload vanished before processing
  EngineFailure,     //< FFmpeg failed or input is not a video
  EngineTimeout,     //< FFmpeg exceeded its deadline and was killed
  AcquisitionFailed, //< Pipeline wrapper for DownloadFailed/UploadMissing
  ExtractionFailed,  //< Pipeline wrapper for engine errors, after rollback
  IOError,           //< Filesystem fault
  NotFound
};

/// Stable name of a code, used in logs
const char *to_string(ErrorCode code);

/**
 * @struct Error
 * @brief Result of a fallible operation.
 */
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;              //< Short summary, safe to show clients
  std::string detail;               //< Underlying error text
  ErrorCode cause = ErrorCode::None; //< Component code behind a wrapper

  bool ok() const { return code == ErrorCode::None; }

  static Error make(ErrorCode code, std::string message,
                    std::string detail = {}) {
    Error e;
    e.code = code;
    e.message = std::move(message);
    e.detail = std::move(detail);
    return e;
  }

  /**
   * @brief Wrap a component error, keeping its detail text.
   * @note The inner message is folded into the detail when the inner error
   *       carries no detail of its own.
   */
  static Error wrap(ErrorCode code, std::string message, const Error &inner) {
    Error e;
    e.code = code;
    e.message = std::move(message);
    e.detail = inner.detail.empty() ? inner.message : inner.detail;
    e.cause = inner.code;
    return e;
  }
};

} // namespace keyframe

#endif // KEYFRAME_ERROR_HPP
