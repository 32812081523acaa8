/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Command-line flags parsed in main.cpp take precedence where both
 *          exist (timeout, verbose).
 *
 * @note Numeric values are parsed with std::stoi/std::stoull and throw
 *       std::invalid_argument or std::out_of_range on malformed input.
 */

#ifndef REPLACER_CONFIG_HPP
#define REPLACER_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

#include "types.hpp"

namespace replacer {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get an unsigned 64-bit value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed value or default
 */
inline uint64_t get_env_u64(const char *name, uint64_t default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoull(val) : default_val;
}

/**
 * @brief Get a raw string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : default_val;
}

/**
 * @brief Worker threads per queue.
 * @note 0 = auto-detect from cgroup limits / hardware concurrency
 */
inline int workers() {
  static int val = get_env_int("REPLACER_WORKERS", 0);
  return val;
}

/**
 * @brief Capacity of each bounded file queue.
 * @note 0 = same as the worker count
 */
inline int queue_capacity() {
  static int val = get_env_int("REPLACER_QUEUE_CAPACITY", 0);
  return val;
}

/// Size above which files take the streaming path
inline uint64_t large_file_threshold() {
  static uint64_t val =
      get_env_u64("REPLACER_LARGE_FILE_THRESHOLD", LARGE_FILE_THRESHOLD);
  return val;
}

/**
 * @brief Default run timeout as a duration string ("3m", "90s", ...)
 * @see parse_duration for the accepted grammar
 */
inline std::string timeout() {
  static std::string val = get_env_string("REPLACER_TIMEOUT", "3m");
  return val;
}

/// Print per-file debug lines
inline bool verbose() {
  static bool val = (get_env_int("REPLACER_VERBOSE", 0) != 0);
  return val;
}

} // namespace Config
} // namespace replacer

#endif // REPLACER_CONFIG_HPP
