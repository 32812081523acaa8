/**
 * @file system.hpp
 * @brief System utilities, CPU detection and duration handling
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker pool sizing
 *
 *          - Duration parsing for the --timeout flag and time formatting
 *
 *          - errno to message translation
 */

#ifndef REPLACER_SYSTEM_HPP
#define REPLACER_SYSTEM_HPP

#include <chrono>
#include <string>

namespace replacer {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the cgroup limit. This function reads cgroup
 *       files to detect the actual limit.
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

/**
 * @brief Calculate the number of workers per queue.
 * @param configured Requested worker count (0 = auto)
 * @return configured capped at the CPU limit, or the CPU limit when auto
 */
int calculate_worker_count(int configured);

// **---- Durations ----**

/**
 * @brief Parse a duration such as "3m", "1m30s" or "250ms".
 *
 * @note A duration is a sequence of <decimal number><unit> pairs with units
 *       ns, us, ms, s, m, h. Every number needs a unit except a lone "0".
 *       A leading '-' yields a negative duration, which expires immediately.
 *
 * @param text Input text
 * @param out Parsed duration on success
 * @return true on success, false if text is malformed
 */
bool parse_duration(const std::string &text, std::chrono::nanoseconds &out);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/// Human-readable message for an errno value
std::string errno_message(int err);

} // namespace replacer

#endif // REPLACER_SYSTEM_HPP
