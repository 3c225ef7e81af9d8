/**
 * @file artifact_store.cpp
 * @brief Output directory management implementation
 */

#include "keyframe/artifact_store.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "keyframe/logging.hpp"
#include "keyframe/system.hpp"

namespace fs = std::filesystem;

namespace keyframe {

namespace {

/// A fresh UUID colliding is practically impossible; a few retries suffice
constexpr int MAX_ALLOCATE_ATTEMPTS = 3;

/// True if `child` is `parent` itself or lies underneath it
bool is_within(const fs::path &parent, const fs::path &child) {
  auto p = parent.begin();
  auto c = child.begin();
  for (; p != parent.end(); ++p, ++c) {
    if (c == child.end() || *p != *c)
      return false;
  }
  return true;
}

} // anonymous namespace

ArtifactStore::ArtifactStore(std::string root) : root_(std::move(root)) {}

bool ArtifactStore::is_safe_component(const std::string &name) {
  if (name.empty() || name == "." || name == "..")
    return false;
  return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

Error ArtifactStore::allocate(OutputLocation &location) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    return Error::make(ErrorCode::IOError, "Cannot create output directory",
                       fmt::format("{}: {}", root_, ec.message()));
  }

  for (int attempt = 0; attempt < MAX_ALLOCATE_ATTEMPTS; ++attempt) {
    std::string job_id = generate_uuid();
    fs::path dir = fs::path(root_) / job_id;

    /// create_directory returns false when the directory already exists
    bool created = fs::create_directory(dir, ec);
    if (ec) {
      return Error::make(ErrorCode::IOError, "Cannot create output directory",
                         fmt::format("{}: {}", dir.string(), ec.message()));
    }
    if (created) {
      location.job_id = std::move(job_id);
      location.path = dir.string();
      return {};
    }
    LOG_WARN("Job id {} already in use, drawing another", job_id);
  }

  return Error::make(ErrorCode::IOError, "Cannot create output directory",
                     "no unused job id found");
}

Error ArtifactStore::remove(const std::string &job_id) {
  if (!is_uuid(job_id)) {
    /// Nothing this store created can have that name
    return {};
  }

  fs::path dir = fs::path(root_) / job_id;
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    LOG_ERROR("Failed to delete {}: {}", dir.string(), ec.message());
    return Error::make(ErrorCode::IOError, "Failed to delete frames",
                       ec.message());
  }
  return {};
}

std::optional<std::string>
ArtifactStore::resolve(const std::string &job_id,
                       const std::string &frame_name) const {
  if (!is_uuid(job_id) || !is_safe_component(frame_name))
    return std::nullopt;

  std::error_code ec;
  fs::path job_dir = fs::canonical(fs::path(root_) / job_id, ec);
  if (ec)
    return std::nullopt;

  /// Symlinks inside the job directory must not lead outside of it
  fs::path frame = fs::canonical(job_dir / frame_name, ec);
  if (ec || !is_within(job_dir, frame) || frame == job_dir)
    return std::nullopt;

  if (!fs::is_regular_file(frame, ec))
    return std::nullopt;
  return frame.string();
}

} // namespace keyframe
