/**
 * @file logging.hpp
 * @brief Console logging and phase timing for the replacer run
 *
 * @details Provides:
 *          - LOG_INFO/LOG_WARN/LOG_ERROR/LOG_PHASE/LOG_SUCCESS used by
 *            main, the walker and the rewrite workers
 *
 *          - LOG_DEBUG for per-file lines (queued, rewritten, skipped),
 *            printed only under --verbose or REPLACER_VERBOSE=1
 *
 *          - TIMER_START/TIMER_END around the "walk" and "run" phases
 *
 *          - TimingCollector, whose table main prints after the run summary
 *
 * @note Every line is written under log_mutex and flushed, so lines from
 *       concurrent workers never interleave mid-line.
 */

#ifndef REPLACER_LOGGING_HPP
#define REPLACER_LOGGING_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace replacer {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief REPLACER_ENABLE_LOGGING / REPLACER_ENABLE_TIMING in CMake set these.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// Set from --verbose or REPLACER_VERBOSE (defined in logging.cpp)
extern std::atomic<bool> log_verbose;

/// Turn per-file LOG_DEBUG lines on or off
void set_verbose(bool enabled);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (replacer::log_verbose.load(std::memory_order_relaxed)) {               \
      std::lock_guard<std::mutex> lock(replacer::log_mutex);                   \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(replacer::log_mutex);                     \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(replacer::log_mutex);                     \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(replacer::log_mutex);                     \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(replacer::log_mutex);                     \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(replacer::log_mutex);                     \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief One timed phase of a run ("walk", "run").
 */
struct TimingEntry {
  std::string name;  //< Phase name passed to TIMER_START
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Process-wide store of phase timings for one replacer invocation.
 * @note The walker records "walk" from the producer thread; the dispatcher
 *       records "run" once its workers have joined.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print the phase table to stdout.
   *        main calls this after print_run_summary.
   */
  static void print_summary();

  /// Copy of the recorded phases, for inspection after a walk
  static std::vector<TimingEntry> snapshot();

  /**
   * @brief Forget recorded phases before a fresh walk.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    replacer::TimingCollector::record(#name, timer_duration_##name);           \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace replacer

#endif // REPLACER_LOGGING_HPP
