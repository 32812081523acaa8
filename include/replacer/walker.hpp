/**
 * @file walker.hpp
 * @brief Directory traversal and size classification
 *
 * @details The Walker enumerates the tree under a root directory with an
 *          explicit stack and routes every regular file to exactly one of
 *          two queues:
 *
 *          - size <= threshold -> small queue
 *
 *          - size >  threshold -> large queue
 *
 *          Per-entry failures are collected and the walk carries on with
 *          siblings. Symbolic links and other non-regular entries are
 *          skipped, never followed.
 */

#ifndef REPLACER_WALKER_HPP
#define REPLACER_WALKER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "types.hpp"

namespace replacer {

class CancellationToken;
class ErrorCollector;
class WorkQueue;

/**
 * @struct WalkStats
 * @brief Counters gathered during one walk.
 */
struct WalkStats {
  size_t directories = 0; //< Directories entered (root included)
  size_t small_files = 0; //< Files routed to the small queue
  size_t large_files = 0; //< Files routed to the large queue
  size_t skipped = 0;     //< Symlinks, devices, sockets, fifos
};

/**
 * @class Walker
 * @brief Single producer feeding the small and large queues.
 */
class Walker {
public:
  /**
   * @param root Directory to walk; the root itself is never queued
   * @param threshold Size in bytes above which a file counts as large
   * @param cancel Polled before every directory entry
   * @param small_queue Destination for files at or below threshold
   * @param large_queue Destination for files above threshold
   * @param errors Sink for per-entry failures
   */
  Walker(std::string root, uint64_t threshold, const CancellationToken &cancel,
         WorkQueue &small_queue, WorkQueue &large_queue,
         ErrorCollector &errors);

  /**
   * @brief Walk the tree, then close both queues.
   *
   * @note Both queues are closed on every exit path, exactly once.
   *
   * @param error Filled with the cancellation reason when the walk aborts
   * @return true if the walk ran to completion (possibly with collected
   *         per-entry errors), false if it was cancelled
   */
  bool run(Error &error);

  const WalkStats &stats() const { return stats_; }

private:
  bool walk_tree(Error &error);
  bool route(WorkItem item, Error &error);
  void record(const std::string &path, const std::string &message);

  std::string root_;
  uint64_t threshold_;
  const CancellationToken &cancel_;
  WorkQueue &small_queue_;
  WorkQueue &large_queue_;
  ErrorCollector &errors_;
  WalkStats stats_;
};

} // namespace replacer

#endif // REPLACER_WALKER_HPP
