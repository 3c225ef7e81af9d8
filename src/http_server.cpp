/**
 * @file http_server.cpp
 * @brief HTTP routing and request decoding
 *
 * @details Request fields are looked up, in order, in a JSON body, in
 *          multipart text parts, and in urlencoded form/query parameters.
 *          The multipart file part "video" is checked against the MIME
 *          allow-list and written to the staging area only after the
 *          interval has been validated and only when no videoUrl is given.
 */

#include "keyframe/http_server.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "keyframe/logging.hpp"
#include "keyframe/system.hpp"

namespace keyframe {

using json = nlohmann::json;

namespace {

const std::vector<std::string> ALLOWED_VIDEO_TYPES = {
    "video/mp4", "video/mpeg", "video/quicktime", "video/x-msvideo",
    "video/webm"};

void send_json(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response &res, int status, const std::string &error,
                const std::string &details = {}) {
  json body = {{"error", error}};
  if (!details.empty())
    body["details"] = details;
  send_json(res, status, body);
}

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string image_content_type(const std::string &path) {
  std::string lower = lowercase(path);
  auto ends_with = [&lower](const char *ext) {
    std::string e(ext);
    return lower.size() >= e.size() &&
           lower.compare(lower.size() - e.size(), e.size(), e) == 0;
  };
  if (ends_with(".jpg") || ends_with(".jpeg"))
    return "image/jpeg";
  if (ends_with(".png"))
    return "image/png";
  return "application/octet-stream";
}

/**
 * @struct ExtractFields
 * @brief Decoded inputs of POST /extract-keyframes.
 */
struct ExtractFields {
  std::optional<std::string> video_url;
  std::optional<std::string> interval;
};

/// Text field from a multipart part (no filename) or a form/query parameter
std::optional<std::string> form_field(const httplib::Request &req,
                                      const char *name) {
  if (req.has_file(name)) {
    const auto &part = req.get_file_value(name);
    if (part.filename.empty())
      return part.content;
  }
  if (req.has_param(name))
    return req.get_param_value(name);
  return std::nullopt;
}

/// JSON scalar to the string form a form field would have carried
std::optional<std::string> json_field(const json &body, const char *name) {
  auto it = body.find(name);
  if (it == body.end() || it->is_null())
    return std::nullopt;
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

/**
 * @brief Collect request fields.
 * @return false when the body claims to be JSON but does not parse, or
 *         carries a non-string videoUrl
 */
bool decode_fields(const httplib::Request &req, ExtractFields &fields,
                   std::string &error) {
  std::string content_type = lowercase(req.get_header_value("Content-Type"));
  if (content_type.rfind("application/json", 0) == 0 && !req.body.empty()) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
      error = "Request body is not a JSON object";
      return false;
    }
    auto url = body.find("videoUrl");
    if (url != body.end() && !url->is_null() && !url->is_string()) {
      error = "videoUrl must be a string";
      return false;
    }
    fields.video_url = json_field(body, "videoUrl");
    fields.interval = json_field(body, "interval");
  }

  if (!fields.video_url)
    fields.video_url = form_field(req, "videoUrl");
  if (!fields.interval)
    fields.interval = form_field(req, "interval");
  return true;
}

} // anonymous namespace

// **---- Free Functions ----**

int http_status_for(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return 200;
  case ErrorCode::InvalidInterval:
  case ErrorCode::NoSourceProvided:
    return 400;
  case ErrorCode::NotFound:
    return 404;
  default:
    return 500;
  }
}

bool is_allowed_video_type(const std::string &content_type) {
  std::string mime = lowercase(content_type.substr(0, content_type.find(';')));
  mime.erase(0, mime.find_first_not_of(" \t"));
  size_t last = mime.find_last_not_of(" \t");
  mime.erase(last == std::string::npos ? 0 : last + 1);
  return std::find(ALLOWED_VIDEO_TYPES.begin(), ALLOWED_VIDEO_TYPES.end(),
                   mime) != ALLOWED_VIDEO_TYPES.end();
}

size_t worker_thread_count(const ServiceConfig &config) {
  if (config.server_threads > 0)
    return static_cast<size_t>(config.server_threads);
  return static_cast<size_t>(std::max(8, detect_cpu_limit()));
}

// **---- HttpServer ----**

HttpServer::HttpServer(const ServiceConfig &config,
                       PipelineCoordinator &pipeline, VideoAcquirer &acquirer,
                       ArtifactStore &store)
    : config_(config), pipeline_(pipeline), acquirer_(acquirer), store_(store),
      server_(std::make_unique<httplib::Server>()) {
  register_routes();
}

HttpServer::~HttpServer() = default;

void HttpServer::register_routes() {
  size_t threads = worker_thread_count(config_);
  server_->new_task_queue = [threads] {
    return new httplib::ThreadPool(threads);
  };
  server_->set_payload_max_length(static_cast<size_t>(config_.max_upload_mb) *
                                  1024 * 1024);

  server_->Post("/extract-keyframes",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_extract(req, res);
                });
  server_->Get(R"(/frames/([^/]+)/([^/]+))",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_get_frame(req, res);
               });
  server_->Delete(R"(/frames/([^/]+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    handle_delete(req, res);
                  });
  server_->Get("/health",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_health(req, res);
               });

  /// Called for every status >= 400; only fill bodies nobody wrote yet
  server_->set_error_handler(
      [](const httplib::Request &, httplib::Response &res) {
        if (!res.body.empty())
          return;
        if (res.status == 404) {
          send_error(res, 404, "Not found");
        } else if (res.status == 413) {
          send_error(res, 413, "File too large",
                     "Request body exceeds the upload limit");
        } else {
          send_error(res, res.status, "Request failed");
        }
      });

  server_->set_exception_handler([](const httplib::Request &req,
                                    httplib::Response &res,
                                    std::exception_ptr ep) {
    std::string details = "unknown exception";
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      details = e.what();
    } catch (...) {
      /// Non-standard exception type, details stay generic
    }
    LOG_ERROR("Unhandled error on {} {}: {}", req.method, req.path, details);
    send_error(res, 500, "Internal server error", details);
  });

  server_->set_logger([](const httplib::Request &req,
                         const httplib::Response &res) {
    LOG_INFO("{} {} -> {}", req.method, req.path, res.status);
  });
}

std::string HttpServer::base_url_for(const httplib::Request &req) const {
  if (!config_.base_url.empty())
    return config_.base_url;
  std::string host = req.get_header_value("Host");
  if (host.empty())
    host = fmt::format("{}:{}", req.local_addr, req.local_port);
  return "http://" + host;
}

// **---- Handlers ----**

void HttpServer::handle_extract(const httplib::Request &req,
                                httplib::Response &res) {
  ExtractFields fields;
  std::string decode_error;
  if (!decode_fields(req, fields, decode_error)) {
    send_error(res, 400, "Invalid request body", decode_error);
    return;
  }

  /// Validate before anything is written to disk
  int interval = DEFAULT_INTERVAL_SEC;
  Error err = PipelineCoordinator::parse_interval(fields.interval, interval);
  if (!err.ok()) {
    send_error(res, http_status_for(err.code), err.message, err.detail);
    return;
  }

  VideoSource source;
  if (fields.video_url && !fields.video_url->empty()) {
    source = VideoSource::from_url(*fields.video_url);
  } else if (req.has_file("video") &&
             !req.get_file_value("video").filename.empty()) {
    const auto &upload = req.get_file_value("video");
    if (!is_allowed_video_type(upload.content_type)) {
      send_error(res, 400, "Invalid file type. Only video files are allowed.",
                 fmt::format("Received {}", upload.content_type.empty()
                                                ? "no content type"
                                                : upload.content_type));
      return;
    }
    std::string staged_path;
    err = acquirer_.stage_upload(upload.content, upload.filename, staged_path);
    if (!err.ok()) {
      send_error(res, http_status_for(err.code), err.message, err.detail);
      return;
    }
    source = VideoSource::from_upload(staged_path);
  }

  ExtractionResult result;
  err = pipeline_.run(interval, source, base_url_for(req), result);
  if (!err.ok()) {
    send_error(res, http_status_for(err.code), err.message, err.detail);
    return;
  }

  send_json(res, 200,
            {{"success", true},
             {"videoId", result.job_id},
             {"interval", result.interval},
             {"frameCount", result.frame_count()},
             {"keyFrames", result.frame_urls}});
}

void HttpServer::handle_get_frame(const httplib::Request &req,
                                  httplib::Response &res) {
  const std::string video_id = req.matches[1];
  const std::string frame_name = req.matches[2];

  auto path = store_.resolve(video_id, frame_name);
  if (!path) {
    send_error(res, 404, "Frame not found");
    return;
  }

  std::ifstream in(*path, std::ios::binary);
  if (!in) {
    send_error(res, 404, "Frame not found");
    return;
  }
  std::string bytes((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
  res.status = 200;
  res.set_content(bytes, image_content_type(*path));
}

void HttpServer::handle_delete(const httplib::Request &req,
                               httplib::Response &res) {
  const std::string video_id = req.matches[1];
  Error err = store_.remove(video_id);
  if (!err.ok()) {
    send_error(res, 500, "Failed to delete frames", err.detail);
    return;
  }
  LOG_INFO("Deleted frames of {}", video_id);
  send_json(res, 200,
            {{"success", true}, {"message", "Frames deleted successfully"}});
}

void HttpServer::handle_health(const httplib::Request &,
                               httplib::Response &res) {
  send_json(res, 200, {{"status", "ok"}, {"timestamp", utc_timestamp()}});
}

// **---- Lifecycle ----**

bool HttpServer::run_listener(bool bound) {
  /// Publish the pending listen before checking for a stop, stop() does the
  /// reverse, so one of the two always sees the other
  listen_pending_ = true;
  if (stop_requested_) {
    listen_pending_ = false;
    return true;
  }
  bool ok = bound ? server_->listen_after_bind()
                  : server_->listen(config_.host, config_.port);
  listen_pending_ = false;
  return ok;
}

bool HttpServer::listen() { return run_listener(false); }

int HttpServer::bind_to_any_port(const std::string &host) {
  return server_->bind_to_any_port(host);
}

bool HttpServer::listen_after_bind() { return run_listener(true); }

void HttpServer::stop() {
  stop_requested_ = true;
  /// httplib ignores stop() until its accept loop is running
  while (listen_pending_ && !server_->is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  server_->stop();
}

bool HttpServer::is_running() const { return server_->is_running(); }

} // namespace keyframe
