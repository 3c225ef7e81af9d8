/**
 * @file http_server.hpp
 * @brief HTTP surface of the service
 *
 * @details Routes:
 *
 *          - POST   /extract-keyframes           run a job
 *
 *          - GET    /frames/:videoId/:frameName  serve one frame
 *
 *          - DELETE /frames/:videoId             drop a job's frames
 *
 *          - GET    /health                      liveness
 *
 *          Every error response is JSON: {"error": ..., "details": ...}.
 */

#ifndef KEYFRAME_HTTP_SERVER_HPP
#define KEYFRAME_HTTP_SERVER_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "artifact_store.hpp"
#include "config.hpp"
#include "error.hpp"
#include "pipeline.hpp"
#include "video_acquirer.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace keyframe {

/// HTTP status for a pipeline or store error
int http_status_for(ErrorCode code);

/**
 * @brief Upload MIME allow-list check.
 * @note Parameters ("; codecs=...") and case are ignored.
 */
bool is_allowed_video_type(const std::string &content_type);

/// Worker pool size: SERVER_THREADS, or max(8, detect_cpu_limit()) when 0
size_t worker_thread_count(const ServiceConfig &config);

class HttpServer {
public:
  HttpServer(const ServiceConfig &config, PipelineCoordinator &pipeline,
             VideoAcquirer &acquirer, ArtifactStore &store);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /**
   * @brief Serve on config.host:config.port until stop().
   * @return false if the socket could not be bound
   */
  bool listen();

  /**
   * @brief Bind to an ephemeral port (tests).
   * @return Port number, or -1 on failure
   */
  int bind_to_any_port(const std::string &host);

  /// Serve on a socket bound by bind_to_any_port()
  bool listen_after_bind();

  /// Thread-safe; makes listen() return
  void stop();

  bool is_running() const;

private:
  const ServiceConfig &config_;
  PipelineCoordinator &pipeline_;
  VideoAcquirer &acquirer_;
  ArtifactStore &store_;
  std::unique_ptr<httplib::Server> server_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> listen_pending_{false};

  bool run_listener(bool bound);

  void register_routes();

  void handle_extract(const httplib::Request &req, httplib::Response &res);
  void handle_get_frame(const httplib::Request &req, httplib::Response &res);
  void handle_delete(const httplib::Request &req, httplib::Response &res);
  void handle_health(const httplib::Request &req, httplib::Response &res);

  /// BASE_URL, or http://<Host header> when unset
  std::string base_url_for(const httplib::Request &req) const;
};

} // namespace keyframe

#endif // KEYFRAME_HTTP_SERVER_HPP
