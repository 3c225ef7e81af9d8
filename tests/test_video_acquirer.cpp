#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <httplib.h>

#include "keyframe/video_acquirer.hpp"
#include "test_helpers.hpp"

namespace keyframe {

namespace fs = std::filesystem;

// **---- URL Splitting ----**

TEST(SplitUrlTest, SplitsOriginAndTarget) {
  std::string origin;
  std::string target;
  ASSERT_TRUE(split_url("https://cdn.example.com:8443/a/b.mp4?sig=1#t=3",
                        origin, target));
  EXPECT_EQ(origin, "https://cdn.example.com:8443");
  EXPECT_EQ(target, "/a/b.mp4?sig=1");

  ASSERT_TRUE(split_url("HTTP://example.com", origin, target));
  EXPECT_EQ(origin, "http://example.com");
  EXPECT_EQ(target, "/");

  ASSERT_TRUE(split_url("http://example.com?x=1", origin, target));
  EXPECT_EQ(target, "/?x=1");
}

TEST(SplitUrlTest, RejectsUnsupportedUrls) {
  std::string origin;
  std::string target;
  EXPECT_FALSE(split_url("ftp://example.com/v.mp4", origin, target));
  EXPECT_FALSE(split_url("file:///etc/passwd", origin, target));
  EXPECT_FALSE(split_url("example.com/v.mp4", origin, target));
  EXPECT_FALSE(split_url("http://user:pw@example.com/v.mp4", origin, target));
  EXPECT_FALSE(split_url("http://exa mple.com/", origin, target));
  EXPECT_FALSE(split_url("", origin, target));
}

// **---- Acquisition ----**

class VideoAcquirerTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_.Get("/video.mp4", [](const httplib::Request &,
                                 httplib::Response &res) {
      res.set_content(std::string(100000, 'v'), "video/mp4");
    });
    server_.Get("/moved", [](const httplib::Request &, httplib::Response &res) {
      res.set_redirect("/video.mp4");
    });
    server_.Get("/slow", [](const httplib::Request &, httplib::Response &res) {
      std::this_thread::sleep_for(std::chrono::seconds(3));
      res.set_content("late", "video/mp4");
    });

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

  std::string url(const std::string &path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  test::TempDir dir_;
  VideoAcquirer acquirer_{dir_.sub("temp"), 1};
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
};

TEST_F(VideoAcquirerTest, DownloadsToStagingArea) {
  std::string staged_path;
  {
    StagedVideo video;
    Error err = acquirer_.acquire(VideoSource::from_url(url("/video.mp4")),
                                  video);
    ASSERT_TRUE(err.ok()) << err.detail;
    EXPECT_TRUE(video.owned());
    staged_path = video.path();
    EXPECT_EQ(fs::path(staged_path).parent_path(), fs::path(dir_.sub("temp")));
    EXPECT_EQ(fs::file_size(staged_path), 100000u);
  }
  /// Dropping the handle discards the staged copy
  EXPECT_FALSE(fs::exists(staged_path));
}

TEST_F(VideoAcquirerTest, FollowsRedirects) {
  StagedVideo video;
  Error err = acquirer_.acquire(VideoSource::from_url(url("/moved")), video);
  ASSERT_TRUE(err.ok()) << err.detail;
  EXPECT_EQ(fs::file_size(video.path()), 100000u);
}

TEST_F(VideoAcquirerTest, HttpErrorLeavesNothingBehind) {
  StagedVideo video;
  Error err = acquirer_.acquire(VideoSource::from_url(url("/missing")), video);
  EXPECT_EQ(err.code, ErrorCode::DownloadFailed);
  EXPECT_EQ(err.message, "Failed to download video from URL");
  EXPECT_NE(err.detail.find("404"), std::string::npos);
  EXPECT_TRUE(video.empty());
  EXPECT_EQ(test::count_entries(dir_.sub("temp")), 0u);
}

TEST_F(VideoAcquirerTest, SlowServerTimesOut) {
  StagedVideo video;
  Error err = acquirer_.acquire(VideoSource::from_url(url("/slow")), video);
  EXPECT_EQ(err.code, ErrorCode::DownloadFailed);
  EXPECT_FALSE(err.detail.empty());
  EXPECT_EQ(test::count_entries(dir_.sub("temp")), 0u);
}

TEST_F(VideoAcquirerTest, UnreachableHostFails) {
  StagedVideo video;
  /// Port 1 on loopback is never served here
  Error err = acquirer_.acquire(
      VideoSource::from_url("http://127.0.0.1:1/video.mp4"), video);
  EXPECT_EQ(err.code, ErrorCode::DownloadFailed);
  EXPECT_EQ(test::count_entries(dir_.sub("temp")), 0u);
}

TEST_F(VideoAcquirerTest, UnsupportedSchemeFails) {
  StagedVideo video;
  Error err =
      acquirer_.acquire(VideoSource::from_url("ftp://example.com/v"), video);
  EXPECT_EQ(err.code, ErrorCode::DownloadFailed);
  EXPECT_FALSE(fs::exists(dir_.sub("temp")));
}

TEST_F(VideoAcquirerTest, NoSource) {
  StagedVideo video;
  EXPECT_EQ(acquirer_.acquire(VideoSource{}, video).code,
            ErrorCode::NoSourceProvided);
  EXPECT_EQ(acquirer_.acquire(VideoSource::from_url(""), video).code,
            ErrorCode::NoSourceProvided);
  EXPECT_EQ(acquirer_.acquire(VideoSource::from_upload(""), video).code,
            ErrorCode::NoSourceProvided);
}

TEST_F(VideoAcquirerTest, StagesUploadWithSafeExtension) {
  std::string path;
  ASSERT_TRUE(acquirer_.stage_upload("abc", "Holiday.MOV", path).ok());
  EXPECT_EQ(fs::path(path).extension(), ".mov");
  EXPECT_EQ(test::read_file(path), "abc");

  std::string odd;
  ASSERT_TRUE(acquirer_.stage_upload("abc", "../../evil.m p4", odd).ok());
  EXPECT_EQ(fs::path(odd).parent_path(), fs::path(dir_.sub("temp")));
  EXPECT_EQ(fs::path(odd).extension(), "");
}

TEST_F(VideoAcquirerTest, UploadIsAdoptedAndOwned) {
  std::string path;
  ASSERT_TRUE(acquirer_.stage_upload("abc", "clip.mp4", path).ok());
  {
    StagedVideo video;
    ASSERT_TRUE(acquirer_.acquire(VideoSource::from_upload(path), video).ok());
    EXPECT_EQ(video.path(), path);
    EXPECT_TRUE(video.owned());
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(VideoAcquirerTest, VanishedUpload) {
  StagedVideo video;
  Error err = acquirer_.acquire(
      VideoSource::from_upload(dir_.sub("temp/gone.mp4")), video);
  EXPECT_EQ(err.code, ErrorCode::UploadMissing);
}

} // namespace keyframe
