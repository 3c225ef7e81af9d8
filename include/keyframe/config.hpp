/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          the ServiceConfig snapshot that is built once at startup and
 *          injected into the components.
 *          See config/keyframe_server.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef KEYFRAME_CONFIG_HPP
#define KEYFRAME_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace keyframe {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws std::invalid_argument / std::out_of_range on malformed values
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// HTTP listen port
inline int port() {
  static int val = get_env_int("PORT", 3000);
  return val;
}

/// HTTP bind address
inline std::string host() {
  static std::string val = get_env_string("HOST", "0.0.0.0");
  return val;
}

/**
 * @brief Public origin used to build frame URLs.
 * @note Empty = derive from the request's own Host header.
 */
inline std::string base_url() {
  static std::string val = get_env_string("BASE_URL", "");
  return val;
}

/// Transient area for downloaded and uploaded videos
inline std::string staging_dir() {
  static std::string val = get_env_string("STAGING_DIR", "temp");
  return val;
}

/// Root holding one subdirectory of frames per job
inline std::string output_dir() {
  static std::string val = get_env_string("OUTPUT_DIR", "uploads");
  return val;
}

/// FFmpeg binary (resolved through PATH if not absolute)
inline std::string ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/// Upper bound for a whole URL download
inline int download_timeout_sec() {
  static int val = get_env_int("DOWNLOAD_TIMEOUT_SEC", 60);
  return val;
}

/**
 * @brief Upper bound for a single FFmpeg run
 * @note 0 = wait forever. The child is killed once the deadline passes.
 */
inline int engine_timeout_sec() {
  static int val = get_env_int("ENGINE_TIMEOUT_SEC", 600);
  return val;
}

/// Maximum accepted request body (uploads), in megabytes
inline int max_upload_mb() {
  static int val = get_env_int("MAX_UPLOAD_MB", 500);
  return val;
}

/// FFmpeg -q:v value for JPEG output (2 = high quality, 31 = worst)
inline int jpeg_quality() {
  static int val = get_env_int("JPEG_QUALITY", 2);
  return val;
}

/// HTTP worker threads (0 = max(8, detect_cpu_limit()))
inline int server_threads() {
  static int val = get_env_int("SERVER_THREADS", 0);
  return val;
}

} // namespace Config

/**
 * @struct ServiceConfig
 * @brief Immutable settings handed to each component at construction.
 * @note Tests build one directly to redirect directories into a sandbox.
 */
struct ServiceConfig {
  std::string host = "0.0.0.0";
  int port = 3000;
  std::string base_url;              //< Empty = derive from request
  std::string staging_dir = "temp";  //< Transient inputs
  std::string output_dir = "uploads"; //< Persisted frames
  std::string ffmpeg_path = "ffmpeg";
  int download_timeout_sec = 60;
  int engine_timeout_sec = 600;      //< 0 = no deadline
  int max_upload_mb = 500;
  int jpeg_quality = 2;
  int server_threads = 0;           //< 0 = sized from the CPU limit

  /**
   * @brief Build from the environment through the Config accessors.
   * @throws std::invalid_argument on malformed or out-of-range values
   */
  static ServiceConfig from_env();
};

} // namespace keyframe

#endif // KEYFRAME_CONFIG_HPP
