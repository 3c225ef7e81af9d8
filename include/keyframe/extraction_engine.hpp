/**
 * @file extraction_engine.hpp
 * @brief Interface of the out-of-process frame extraction engine
 *
 * @details The engine turns one staged video into frame_<n>.jpg files in an
 *          output directory, one frame every `interval` seconds starting at
 *          t=0. How it does that (subprocess, service call) stays behind
 *          run(); callers only see success or a typed failure.
 */

#ifndef KEYFRAME_EXTRACTION_ENGINE_HPP
#define KEYFRAME_EXTRACTION_ENGINE_HPP

#include <string>

#include "error.hpp"

namespace keyframe {

/**
 * @struct EngineRequest
 * @brief One extraction run.
 */
struct EngineRequest {
  std::string input_path; //< Staged video
  std::string output_dir; //< Existing, empty job directory
  int interval;           //< Seconds between samples
};

/**
 * @class ExtractionEngine
 * @brief Abstract frame extraction backend.
 */
class ExtractionEngine {
public:
  virtual ~ExtractionEngine() = default;

  /**
   * @brief Run to completion.
   * @return Ok, or EngineFailure / EngineTimeout with the engine's error text
   * @note Must return in bounded time or report EngineTimeout; it never
   *       leaves a running process behind.
   */
  virtual Error run(const EngineRequest &request) = 0;

  /// Short name for logs
  virtual std::string name() const = 0;
};

} // namespace keyframe

#endif // KEYFRAME_EXTRACTION_ENGINE_HPP
