#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "keyframe/http_server.hpp"
#include "test_helpers.hpp"

namespace keyframe {

namespace fs = std::filesystem;
using json = nlohmann::json;

TEST(HttpStatusTest, MapsErrorCodes) {
  EXPECT_EQ(http_status_for(ErrorCode::None), 200);
  EXPECT_EQ(http_status_for(ErrorCode::InvalidInterval), 400);
  EXPECT_EQ(http_status_for(ErrorCode::NoSourceProvided), 400);
  EXPECT_EQ(http_status_for(ErrorCode::NotFound), 404);
  EXPECT_EQ(http_status_for(ErrorCode::AcquisitionFailed), 500);
  EXPECT_EQ(http_status_for(ErrorCode::ExtractionFailed), 500);
  EXPECT_EQ(http_status_for(ErrorCode::IOError), 500);
}

TEST(VideoTypeTest, AllowList) {
  EXPECT_TRUE(is_allowed_video_type("video/mp4"));
  EXPECT_TRUE(is_allowed_video_type("Video/QuickTime"));
  EXPECT_TRUE(is_allowed_video_type("video/webm; codecs=vp9"));
  EXPECT_TRUE(is_allowed_video_type("video/x-msvideo"));
  EXPECT_TRUE(is_allowed_video_type("video/mpeg"));
  EXPECT_FALSE(is_allowed_video_type("video/x-matroska"));
  EXPECT_FALSE(is_allowed_video_type("image/jpeg"));
  EXPECT_FALSE(is_allowed_video_type(""));
}

TEST(WorkerPoolTest, SizedFromConfigOrCpuLimit) {
  ServiceConfig config;
  config.server_threads = 3;
  EXPECT_EQ(worker_thread_count(config), 3u);

  config.server_threads = 0;
  EXPECT_EQ(worker_thread_count(config),
            static_cast<size_t>(std::max(8, detect_cpu_limit())));
  EXPECT_GE(worker_thread_count(config), 8u);
}

class HttpServerTest : public ::testing::Test {
protected:
  HttpServerTest()
      : config_(make_config(dir_)),
        acquirer_(config_.staging_dir, config_.download_timeout_sec),
        store_(config_.output_dir), extractor_(engine_),
        pipeline_(acquirer_, store_, extractor_),
        server_(config_, pipeline_, acquirer_, store_) {}

  static ServiceConfig make_config(const test::TempDir &dir) {
    ServiceConfig config;
    config.host = "127.0.0.1";
    config.staging_dir = dir.sub("temp");
    config.output_dir = dir.sub("uploads");
    config.download_timeout_sec = 2;
    config.max_upload_mb = 1;
    config.server_threads = 2;
    return config;
  }

  void SetUp() override {
    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    while (!server_.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable())
      thread_.join();
  }

  httplib::Client client() const { return httplib::Client("127.0.0.1", port_); }

  /// Path part of an absolute frame URL
  std::string path_of(const std::string &url) const {
    std::string prefix = "http://127.0.0.1:" + std::to_string(port_);
    EXPECT_EQ(url.rfind(prefix, 0), 0u) << url;
    return url.substr(prefix.size());
  }

  test::TempDir dir_;
  ServiceConfig config_;
  test::FakeEngine engine_;
  VideoAcquirer acquirer_;
  ArtifactStore store_;
  FrameExtractor extractor_;
  PipelineCoordinator pipeline_;
  HttpServer server_;
  std::thread thread_;
  int port_ = 0;
};

TEST_F(HttpServerTest, Health) {
  auto res = client().Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  std::string ts = body["timestamp"];
  EXPECT_EQ(ts.back(), 'Z');
}

TEST_F(HttpServerTest, InvalidIntervalWritesNothing) {
  auto cli = client();
  for (const char *payload :
       {R"({"videoUrl":"http://127.0.0.1:1/v.mp4","interval":0})",
        R"({"videoUrl":"http://127.0.0.1:1/v.mp4","interval":61})",
        R"({"videoUrl":"http://127.0.0.1:1/v.mp4","interval":"abc"})"}) {
    auto res = cli.Post("/extract-keyframes", payload, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400) << payload;
    EXPECT_EQ(json::parse(res->body)["error"],
              "Interval must be between 1 and 60 seconds");
  }

  httplib::MultipartFormDataItems items = {
      {"interval", "0", "", ""},
      {"video", "fake video", "clip.mp4", "video/mp4"}};
  auto res = cli.Post("/extract-keyframes", items);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);

  EXPECT_EQ(engine_.calls.load(), 0);
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);
  EXPECT_FALSE(fs::exists(config_.output_dir));
}

TEST_F(HttpServerTest, MissingSource) {
  auto res = client().Post("/extract-keyframes", R"({"interval":5})",
                           "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"],
            "Either videoUrl or video file must be provided");
  EXPECT_FALSE(fs::exists(config_.output_dir));
}

TEST_F(HttpServerTest, MalformedJsonBody) {
  auto res =
      client().Post("/extract-keyframes", "{not json", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"], "Invalid request body");
}

TEST_F(HttpServerTest, NonStringVideoUrl) {
  auto cli = client();
  for (const char *payload : {R"({"videoUrl":123})", R"({"videoUrl":["a"]})",
                              R"({"videoUrl":{"u":"http://x"}})"}) {
    auto res = cli.Post("/extract-keyframes", payload, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400) << payload;
    EXPECT_EQ(json::parse(res->body)["error"], "Invalid request body");
  }
  EXPECT_EQ(engine_.calls.load(), 0);
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);
}

TEST_F(HttpServerTest, RejectsNonVideoUpload) {
  httplib::MultipartFormDataItems items = {
      {"video", "hello", "notes.txt", "text/plain"}};
  auto res = client().Post("/extract-keyframes", items);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"],
            "Invalid file type. Only video files are allowed.");
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);
  EXPECT_EQ(engine_.calls.load(), 0);
}

TEST_F(HttpServerTest, FailedDownloadIsServerError) {
  auto res = client().Post("/extract-keyframes",
                           R"({"videoUrl":"http://127.0.0.1:1/v.mp4"})",
                           "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  json body = json::parse(res->body);
  EXPECT_EQ(body["error"], "Failed to download video from URL");
  EXPECT_TRUE(body.contains("details"));
}

TEST_F(HttpServerTest, EngineFailureIsServerError) {
  engine_.mode = test::FakeEngine::Mode::FailAfterPartialOutput;
  httplib::MultipartFormDataItems items = {
      {"video", "fake video", "clip.mp4", "video/mp4"}};
  auto res = client().Post("/extract-keyframes", items);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(json::parse(res->body)["error"], "Failed to extract keyframes");
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);
  EXPECT_EQ(test::count_entries(config_.output_dir), 0u);
}

TEST_F(HttpServerTest, ThrowingEngineIsExtractionFailure) {
  engine_.mode = test::FakeEngine::Mode::Throw;
  httplib::MultipartFormDataItems items = {
      {"video", "fake video", "clip.mp4", "video/mp4"}};
  auto res = client().Post("/extract-keyframes", items);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(json::parse(res->body)["error"], "Failed to extract keyframes");
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);
  EXPECT_EQ(test::count_entries(config_.output_dir), 0u);
}

TEST_F(HttpServerTest, UploadExtractFetchDelete) {
  auto cli = client();
  httplib::MultipartFormDataItems items = {
      {"interval", "2", "", ""},
      {"video", "fake video", "clip.mp4", "video/mp4"}};
  auto res = cli.Post("/extract-keyframes", items);
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  json body = json::parse(res->body);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["interval"], 2);
  EXPECT_EQ(body["frameCount"], 3);
  ASSERT_EQ(body["keyFrames"].size(), 3u);
  std::string video_id = body["videoId"];
  EXPECT_EQ(engine_.last_request.interval, 2);
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);

  std::string first = body["keyFrames"][0];
  EXPECT_EQ(path_of(first), "/frames/" + video_id + "/frame_1.jpg");

  auto frame = cli.Get(path_of(first).c_str());
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->status, 200);
  EXPECT_EQ(frame->body, "jpeg-1");
  EXPECT_EQ(frame->get_header_value("Content-Type"), "image/jpeg");

  auto del = cli.Delete(("/frames/" + video_id).c_str());
  ASSERT_TRUE(del);
  EXPECT_EQ(del->status, 200);
  EXPECT_EQ(json::parse(del->body)["message"], "Frames deleted successfully");

  frame = cli.Get(path_of(first).c_str());
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->status, 404);
  EXPECT_EQ(json::parse(frame->body)["error"], "Frame not found");
}

TEST_F(HttpServerTest, UrlWinsOverUpload) {
  httplib::MultipartFormDataItems items = {
      {"videoUrl", "http://127.0.0.1:1/v.mp4", "", ""},
      {"video", "fake video", "clip.mp4", "video/mp4"}};
  auto res = client().Post("/extract-keyframes", items);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(json::parse(res->body)["error"],
            "Failed to download video from URL");
  EXPECT_EQ(test::count_entries(config_.staging_dir), 0u);
}

TEST_F(HttpServerTest, DeleteIsIdempotent) {
  auto cli = client();
  const std::string path = "/frames/" + generate_uuid();
  for (int i = 0; i < 2; ++i) {
    auto res = cli.Delete(path.c_str());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["success"], true);
  }
}

TEST_F(HttpServerTest, FrameLookupCannotEscape) {
  test::write_file(dir_.sub("secret.txt"), "secret");
  fs::create_directories(config_.output_dir);

  auto cli = client();
  for (const char *path :
       {"/frames/%2E%2E/secret.txt", "/frames/..%2F..%2Fsecret.txt/x",
        "/frames/x/..%2Fsecret.txt"}) {
    auto res = cli.Get(path);
    ASSERT_TRUE(res) << path;
    EXPECT_EQ(res->status, 404) << path;
    EXPECT_EQ(res->body.find("secret"), std::string::npos) << path;
  }
}

TEST_F(HttpServerTest, UnknownRoute) {
  auto res = client().Get("/nope");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(json::parse(res->body)["error"], "Not found");
}

// **---- Shutdown ----**

TEST(HttpServerShutdownTest, StopBeforeListenIsHonoured) {
  test::TempDir dir;
  ServiceConfig config;
  config.staging_dir = dir.sub("temp");
  config.output_dir = dir.sub("uploads");
  config.server_threads = 1;
  test::FakeEngine engine;
  VideoAcquirer acquirer(config.staging_dir, 1);
  ArtifactStore store(config.output_dir);
  FrameExtractor extractor(engine);
  PipelineCoordinator pipeline(acquirer, store, extractor);
  HttpServer server(config, pipeline, acquirer, store);

  ASSERT_GT(server.bind_to_any_port("127.0.0.1"), 0);
  server.stop();

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(server.listen_after_bind());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
  EXPECT_FALSE(server.is_running());
}

TEST(HttpServerShutdownTest, StopRacingListenerStartup) {
  test::TempDir dir;
  ServiceConfig config;
  config.staging_dir = dir.sub("temp");
  config.output_dir = dir.sub("uploads");
  config.server_threads = 1;
  test::FakeEngine engine;
  VideoAcquirer acquirer(config.staging_dir, 1);
  ArtifactStore store(config.output_dir);
  FrameExtractor extractor(engine);
  PipelineCoordinator pipeline(acquirer, store, extractor);

  for (int i = 0; i < 20; ++i) {
    HttpServer server(config, pipeline, acquirer, store);
    ASSERT_GT(server.bind_to_any_port("127.0.0.1"), 0);
    std::thread listener([&server] { server.listen_after_bind(); });
    server.stop();
    listener.join();
    EXPECT_FALSE(server.is_running());
  }
}

} // namespace keyframe
