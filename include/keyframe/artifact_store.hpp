/**
 * @file artifact_store.hpp
 * @brief Per-job output directories under a single root
 *
 * @details Layout: <root>/<job_id>/frame_<n>.jpg. Job ids are random UUIDs,
 *          so concurrent jobs never share a directory and no locking is
 *          needed. Identifiers coming from clients are validated before they
 *          are joined onto the root.
 */

#ifndef KEYFRAME_ARTIFACT_STORE_HPP
#define KEYFRAME_ARTIFACT_STORE_HPP

#include <optional>
#include <string>

#include "error.hpp"
#include "types.hpp"

namespace keyframe {

class ArtifactStore {
public:
  explicit ArtifactStore(std::string root);

  /**
   * @brief Create a fresh, empty job directory.
   * @param location Output: job id and directory
   * @return IOError or ok
   */
  Error allocate(OutputLocation &location);

  /**
   * @brief Recursively delete a job directory.
   * @return IOError, or ok (also when the job does not exist or the id is
   *         not a valid job id)
   */
  Error remove(const std::string &job_id);

  /**
   * @brief Map a client supplied (job id, frame name) to a local file.
   * @return Path of an existing regular file inside the job directory, or
   *         nullopt (not found, invalid id, traversal attempt)
   */
  std::optional<std::string> resolve(const std::string &job_id,
                                     const std::string &frame_name) const;

  /**
   * @brief True if `name` can be used as a single path component.
   * @note Rejects "", ".", "..", separators and NUL.
   */
  static bool is_safe_component(const std::string &name);

  const std::string &root() const { return root_; }

private:
  std::string root_;
};

} // namespace keyframe

#endif // KEYFRAME_ARTIFACT_STORE_HPP
