/**
 * @file video_acquirer.cpp
 * @brief Video download and upload staging implementation
 */

#include "keyframe/video_acquirer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <regex>
#include <system_error>
#include <utility>

/// POSIX file APIs for fsync'ed writes
#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>
#include <httplib.h>

#include "keyframe/logging.hpp"
#include "keyframe/system.hpp"

namespace fs = std::filesystem;

namespace keyframe {

namespace {

constexpr const char *DOWNLOAD_FAILED = "Failed to download video from URL";

/**
 * @class DurableFile
 * @brief Exclusive-create file that is fsync'ed on commit and removed when
 *        dropped uncommitted.
 */
class DurableFile {
public:
  explicit DurableFile(std::string path) : path_(std::move(path)) {}

  ~DurableFile() {
    if (fd_ != -1)
      close(fd_);
    if (created_ && !committed_) {
      std::error_code ec;
      fs::remove(path_, ec);
      if (ec) {
        LOG_WARN("Failed to cleanup {}: {}", path_, ec.message());
      }
    }
  }

  DurableFile(const DurableFile &) = delete;
  DurableFile &operator=(const DurableFile &) = delete;

  bool open(std::string &error) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd_ == -1) {
      error = fmt::format("Cannot create {}: {}", path_, std::strerror(errno));
      return false;
    }
    created_ = true;
    return true;
  }

  bool write(const char *data, size_t len, std::string &error) {
    while (len > 0) {
      ssize_t n = ::write(fd_, data, len);
      if (n == -1) {
        if (errno == EINTR)
          continue;
        error = fmt::format("Write to {} failed: {}", path_,
                            std::strerror(errno));
        return false;
      }
      data += n;
      len -= static_cast<size_t>(n);
    }
    return true;
  }

  /// Flush to durable storage and close
  bool commit(std::string &error) {
    if (fsync(fd_) == -1) {
      error = fmt::format("fsync {} failed: {}", path_, std::strerror(errno));
      return false;
    }
    int fd = fd_;
    fd_ = -1;
    if (close(fd) == -1) {
      error = fmt::format("close {} failed: {}", path_, std::strerror(errno));
      return false;
    }
    committed_ = true;
    return true;
  }

private:
  std::string path_;
  int fd_ = -1;
  bool created_ = false;
  bool committed_ = false;
};

/// Keep the client's extension only if it is short and alphanumeric
std::string safe_extension(const std::string &original_name) {
  std::string ext = fs::path(original_name).extension().string();
  if (ext.size() < 2 || ext.size() > 10)
    return {};
  bool ok = std::all_of(ext.begin() + 1, ext.end(), [](unsigned char c) {
    return std::isalnum(c) != 0;
  });
  if (!ok)
    return {};
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

} // anonymous namespace

// **---- URL Handling ----**

bool split_url(const std::string &url, std::string &origin,
               std::string &target) {
  static const std::regex re(R"(^([A-Za-z][A-Za-z0-9+.-]*)://([^/?#\s]+)([^#\s]*)(#.*)?$)");
  std::smatch m;
  if (!std::regex_match(url, m, re))
    return false;

  std::string scheme = m[1].str();
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (scheme != "http" && scheme != "https")
    return false;

  /// Userinfo is not supported by the client
  std::string authority = m[2].str();
  if (authority.find('@') != std::string::npos)
    return false;

  origin = scheme + "://" + authority;
  target = m[3].str();
  if (target.empty() || target[0] != '/')
    target = "/" + target;
  return true;
}

// **---- VideoAcquirer ----**

VideoAcquirer::VideoAcquirer(std::string staging_dir, int download_timeout_sec)
    : staging_dir_(std::move(staging_dir)),
      download_timeout_sec_(download_timeout_sec) {}

Error VideoAcquirer::acquire(const VideoSource &source, StagedVideo &video) {
  switch (source.kind) {
  case VideoSource::Kind::Url:
    if (source.value.empty())
      break;
    return download(source.value, video);

  case VideoSource::Kind::UploadedFile: {
    if (source.value.empty())
      break;
    std::error_code ec;
    if (!fs::is_regular_file(source.value, ec)) {
      return Error::make(ErrorCode::UploadMissing, "Uploaded file is missing",
                         fmt::format("{} does not exist", source.value));
    }
    video = StagedVideo(source.value, true);
    return {};
  }

  case VideoSource::Kind::None:
    break;
  }

  return Error::make(ErrorCode::NoSourceProvided,
                     "Either videoUrl or video file must be provided");
}

Error VideoAcquirer::new_staging_path(const std::string &extension,
                                      std::string &path) {
  std::error_code ec;
  fs::create_directories(staging_dir_, ec);
  if (ec) {
    return Error::make(ErrorCode::IOError, "Cannot create staging directory",
                       fmt::format("{}: {}", staging_dir_, ec.message()));
  }
  path = (fs::path(staging_dir_) / (generate_uuid() + extension)).string();
  return {};
}

Error VideoAcquirer::stage_upload(const std::string &content,
                                  const std::string &original_name,
                                  std::string &path) {
  std::string staged_path;
  Error err = new_staging_path(safe_extension(original_name), staged_path);
  if (!err.ok())
    return err;

  DurableFile file(staged_path);
  std::string io_error;
  if (!file.open(io_error) ||
      !file.write(content.data(), content.size(), io_error) ||
      !file.commit(io_error)) {
    LOG_ERROR("Failed to stage upload {}: {}", original_name, io_error);
    return Error::make(ErrorCode::IOError, "Failed to store uploaded file",
                       io_error);
  }

  LOG_INFO("Staged upload {} ({} bytes) as {}", original_name, content.size(),
           staged_path);
  path = std::move(staged_path);
  return {};
}

Error VideoAcquirer::download(const std::string &url, StagedVideo &video) {
  std::string origin;
  std::string target;
  if (!split_url(url, origin, target)) {
    return Error::make(ErrorCode::DownloadFailed, DOWNLOAD_FAILED,
                       fmt::format("Unsupported or malformed URL: {}", url));
  }

  httplib::Client cli(origin);
  if (!cli.is_valid()) {
    return Error::make(ErrorCode::DownloadFailed, DOWNLOAD_FAILED,
                       fmt::format("Cannot connect to {}", origin));
  }
  cli.set_follow_location(true);
  cli.set_connection_timeout(download_timeout_sec_, 0);
  cli.set_read_timeout(download_timeout_sec_, 0);

  std::string path;
  Error err = new_staging_path(".mp4", path);
  if (!err.ok())
    return Error::wrap(ErrorCode::DownloadFailed, DOWNLOAD_FAILED, err);

  DurableFile file(path);
  std::string io_error;
  if (!file.open(io_error)) {
    return Error::make(ErrorCode::DownloadFailed, DOWNLOAD_FAILED, io_error);
  }

  LOG_INFO("Downloading {}", url);
  TIMER_START(download);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(download_timeout_sec_);
  int status = 0;
  size_t received = 0;
  bool deadline_hit = false;
  bool write_failed = false;

  auto res = cli.Get(
      target,
      [&](const httplib::Response &response) {
        status = response.status;
        return status >= 200 && status < 300;
      },
      [&](const char *data, size_t len) {
        if (std::chrono::steady_clock::now() > deadline) {
          deadline_hit = true;
          return false;
        }
        if (!file.write(data, len, io_error)) {
          write_failed = true;
          return false;
        }
        received += len;
        return true;
      });

  if (!res || res->status < 200 || res->status >= 300) {
    std::string detail;
    if (deadline_hit) {
      detail = fmt::format("timeout of {}s exceeded", download_timeout_sec_);
    } else if (write_failed) {
      detail = io_error;
    } else if (status != 0 && (status < 200 || status >= 300)) {
      detail = fmt::format("Request failed with status code {}", status);
    } else if (res) {
      detail = fmt::format("Request failed with status code {}", res->status);
    } else {
      detail = httplib::to_string(res.error());
    }
    LOG_WARN("Download of {} failed: {}", url, detail);
    return Error::make(ErrorCode::DownloadFailed, DOWNLOAD_FAILED, detail);
  }

  if (!file.commit(io_error)) {
    LOG_ERROR("Download of {} could not be flushed: {}", url, io_error);
    return Error::make(ErrorCode::DownloadFailed, DOWNLOAD_FAILED, io_error);
  }
  TIMER_END(download);

  LOG_INFO("Downloaded {} bytes to {}", received, path);
  video = StagedVideo(path, true);
  return {};
}

} // namespace keyframe
