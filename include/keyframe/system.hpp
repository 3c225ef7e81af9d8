/**
 * @file system.hpp
 * @brief System utilities: CPU detection, identifiers and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Random UUID generation for job and staging file names
 *
 *          - Time formatting utilities
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef KEYFRAME_SYSTEM_HPP
#define KEYFRAME_SYSTEM_HPP

#include <string>

namespace keyframe {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Identifiers ----**

/**
 * @brief Random (version 4) UUID in lowercase canonical form.
 * @note 122 random bits; collisions are not expected in practice, callers
 *       still create directories exclusively and retry on EEXIST.
 */
std::string generate_uuid();

/**
 * @brief Check that a string is a canonical lowercase/uppercase UUID.
 * @note Used to reject job identifiers before they reach the filesystem.
 */
bool is_uuid(const std::string &text);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Current UTC time as ISO-8601 with milliseconds.
 * @return e.g. "2024-05-01T12:34:56.789Z"
 */
std::string utc_timestamp();

} // namespace keyframe

#endif // KEYFRAME_SYSTEM_HPP
