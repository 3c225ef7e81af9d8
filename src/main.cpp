/**
 * @file main.cpp
 * @brief Entry point for the keyframe extraction server
 *
 * @details Main entry point that handles:
 *
 *          - Configuration loading from the environment
 *
 *          - Staging/output directory bootstrap
 *
 *          - Component wiring and HTTP serving
 *
 *          - Graceful shutdown on SIGINT/SIGTERM
 *
 * @note SIGINT/SIGTERM are blocked in every thread and consumed by a
 *       dedicated sigwait() thread, which stops the server. Child processes
 *       get their signal mask reset in run_process().
 */

#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

#include <pthread.h>
#include <signal.h>

extern "C" {
#include <libavutil/log.h>
}

#include "keyframe/artifact_store.hpp"
#include "keyframe/config.hpp"
#include "keyframe/ffmpeg_executor.hpp"
#include "keyframe/frame_extractor.hpp"
#include "keyframe/http_server.hpp"
#include "keyframe/logging.hpp"
#include "keyframe/pipeline.hpp"
#include "keyframe/video_acquirer.hpp"

using namespace keyframe;

namespace {

bool ensure_directory(const std::string &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create directory {}: {}", dir, ec.message());
    return false;
  }
  return true;
}

} // anonymous namespace

// **---- MAIN ----**

int main() {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  /// Block termination signals before any thread is started
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  ServiceConfig config;
  try {
    config = ServiceConfig::from_env();
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  }

  /// Probe failures are reported through our own logs
  av_log_set_level(AV_LOG_ERROR);

  if (!ensure_directory(config.staging_dir) ||
      !ensure_directory(config.output_dir)) {
    return 1;
  }

  FFmpegExecutor engine(config.ffmpeg_path, config.jpeg_quality,
                        config.engine_timeout_sec);
  VideoAcquirer acquirer(config.staging_dir, config.download_timeout_sec);
  ArtifactStore store(config.output_dir);
  FrameExtractor extractor(engine);
  PipelineCoordinator pipeline(acquirer, store, extractor);
  HttpServer server(config, pipeline, acquirer, store);

  std::thread signal_thread([&server, signals]() {
    int sig = 0;
    sigwait(&signals, &sig);
    LOG_WARN("Received signal {}, shutting down", sig);
    server.stop();
  });

  LOG_PHASE("Keyframe extraction API running on port {}", config.port);
  LOG_INFO("POST   /extract-keyframes           - Extract frames from video");
  LOG_INFO("GET    /frames/:videoId/:frameName  - Retrieve frame image");
  LOG_INFO("DELETE /frames/:videoId             - Delete all frames");
  LOG_INFO("GET    /health                      - Health check");
  LOG_INFO("Staging: {}  Output: {}  Engine timeout: {}s", config.staging_dir,
           config.output_dir, config.engine_timeout_sec);

  bool listened = server.listen();
  int rc = 0;
  if (!listened) {
    LOG_ERROR("Failed to listen on {}:{}", config.host, config.port);
    rc = 1;
    /// Wake the signal thread so it can be joined
    pthread_kill(signal_thread.native_handle(), SIGTERM);
  }
  signal_thread.join();

  TimingCollector::print_summary();
  LOG_INFO("Server stopped");
  return rc;
}
