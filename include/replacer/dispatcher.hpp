/**
 * @file dispatcher.hpp
 * @brief Concurrent walk + rewrite orchestration
 *
 * @details The Dispatcher runs one replacement job:
 *
 *          - Spawns the walker thread (single producer)
 *
 *          - Spawns N small-file workers and N large-file workers, where N
 *            is the cgroup-aware CPU count unless configured
 *
 *          - Both queues are bounded (default capacity N), so the walker
 *            blocks when workers fall behind
 *
 *          - Every failure lands in one synchronized ErrorCollector
 *
 *          - Waits for every thread, then returns a RunReport
 *
 * @note Configuration via environment variables:
 *
 *       - REPLACER_WORKERS: workers per queue (0 = auto)
 *
 *       - REPLACER_QUEUE_CAPACITY: queue bound (0 = worker count)
 *
 *       - REPLACER_LARGE_FILE_THRESHOLD: streaming threshold in bytes
 */

#ifndef REPLACER_DISPATCHER_HPP
#define REPLACER_DISPATCHER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace replacer {

class CancellationToken;
class ErrorCollector;
class WorkQueue;

/**
 * @struct RunOptions
 * @brief Inputs of one replacement job.
 */
struct RunOptions {
  std::string search;  //< Literal pattern
  std::string replace; //< Replacement text
  std::string root;    //< Directory to process
  uint64_t large_file_threshold = LARGE_FILE_THRESHOLD;
  size_t queue_capacity = 0; //< 0 = worker count
};

/**
 * @struct RunReport
 * @brief Aggregate outcome of a run.
 */
struct RunReport {
  size_t small_files = 0;     //< Files routed to the in-memory path
  size_t large_files = 0;     //< Files routed to the streaming path
  size_t rewritten = 0;       //< Files replaced on disk
  size_t unchanged = 0;       //< Files processed with no match
  size_t replacements = 0;    //< Total occurrences replaced
  int workers = 0;            //< Workers per queue
  double wall_clock_sec = 0;  //< Elapsed time of the whole run
  bool cancelled = false;     //< The token fired before completion
  std::vector<Error> errors;  //< Every collected failure
};

/**
 * @class Dispatcher
 * @brief Owns the two worker pools for one run at a time.
 */
class Dispatcher {
public:
  /**
   * @brief Construct a dispatcher.
   * @param num_workers Workers per queue (0 = auto-detect)
   */
  explicit Dispatcher(int num_workers = 0);

  /**
   * @brief Process every file under options.root.
   * @param options Job description
   * @param cancel Deadline / interrupt shared by every thread
   * @return Report with counters and all collected errors
   */
  RunReport run(const RunOptions &options, const CancellationToken &cancel);

  int workers() const { return num_workers_; }

private:
  enum class Strategy { InMemory, Streaming };

  /**
   * @brief Worker loop for either pool.
   * @param worker_id Index within its pool (for logging)
   * @param strategy Which rewriter to apply to claimed files
   */
  void worker(int worker_id, Strategy strategy, WorkQueue &queue,
              const RunOptions &options, const CancellationToken &cancel,
              ErrorCollector &errors);

  int num_workers_;
  std::atomic<size_t> rewritten_{0};
  std::atomic<size_t> unchanged_{0};
  std::atomic<size_t> replacements_{0};
};

/**
 * @brief Print the run summary table followed by every collected error.
 * @param report Result of Dispatcher::run
 */
void print_run_summary(const RunReport &report);

} // namespace replacer

#endif // REPLACER_DISPATCHER_HPP
