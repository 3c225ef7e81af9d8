/**
 * @file config.cpp
 * @brief ServiceConfig assembly and validation
 */

#include "keyframe/config.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace keyframe {

namespace {

void require_range(const char *name, int value, int lo, int hi) {
  if (value < lo || value > hi) {
    throw std::invalid_argument(
        fmt::format("{}={} is outside [{}, {}]", name, value, lo, hi));
  }
}

} // namespace

ServiceConfig ServiceConfig::from_env() {
  ServiceConfig cfg;
  cfg.host = Config::host();
  cfg.port = Config::port();
  cfg.base_url = Config::base_url();
  cfg.staging_dir = Config::staging_dir();
  cfg.output_dir = Config::output_dir();
  cfg.ffmpeg_path = Config::ffmpeg_path();
  cfg.download_timeout_sec = Config::download_timeout_sec();
  cfg.engine_timeout_sec = Config::engine_timeout_sec();
  cfg.max_upload_mb = Config::max_upload_mb();
  cfg.jpeg_quality = Config::jpeg_quality();
  cfg.server_threads = Config::server_threads();

  /// Trailing slash would produce "//frames/..." URLs
  while (!cfg.base_url.empty() && cfg.base_url.back() == '/') {
    cfg.base_url.pop_back();
  }

  require_range("PORT", cfg.port, 0, 65535);
  require_range("DOWNLOAD_TIMEOUT_SEC", cfg.download_timeout_sec, 1, 86400);
  require_range("ENGINE_TIMEOUT_SEC", cfg.engine_timeout_sec, 0, 86400);
  require_range("MAX_UPLOAD_MB", cfg.max_upload_mb, 1, 1 << 20);
  require_range("JPEG_QUALITY", cfg.jpeg_quality, 1, 31);
  require_range("SERVER_THREADS", cfg.server_threads, 0, 1024);
  return cfg;
}

} // namespace keyframe
