/**
 * @file work_queue.hpp
 * @brief Thread-safe bounded file queue and error collection
 *
 * @details Provides:
 *          - WorkQueue: Bounded single-producer / multi-consumer file queue
 *
 *          - ErrorCollector: Thread-safe aggregator for failures
 */

#ifndef REPLACER_WORK_QUEUE_HPP
#define REPLACER_WORK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <vector>

#include "types.hpp"

namespace replacer {

class CancellationToken;

/**
 * @class WorkQueue
 * @brief Bounded queue of discovered files.
 *
 * @attention DESIGN:
 *
 * - The walker pushes; a pool of workers pops
 *
 * - push() blocks while the queue is full (backpressure on the walker)
 *
 * - pop() blocks while the queue is empty and still open
 *
 * - close() wakes everyone; remaining items are still handed out, then
 *   pop() returns false
 */
class WorkQueue {
public:
  /**
   * @brief Construct a queue.
   * @param capacity Maximum queued items before push() blocks (min 1)
   */
  explicit WorkQueue(size_t capacity);

  WorkQueue(const WorkQueue &) = delete;
  WorkQueue &operator=(const WorkQueue &) = delete;

  /**
   * @brief Add an item, waiting for room if the queue is full.
   * @note While waiting the token is polled so a producer never blocks
   *       forever on consumers that have stopped.
   * @return false if the queue is closed or the token fired
   */
  bool push(WorkItem item, const CancellationToken &cancel);

  /**
   * @brief Pop an item from the queue.
   * @note Blocks until an item is available or the queue is closed.
   * @param item Output parameter for the item
   * @return true if an item was retrieved, false if closed and drained
   */
  bool pop(WorkItem &item);

  /**
   * @brief Signal that no more items will be added.
   * @return true on the first call, false if already closed
   */
  bool close();

  bool closed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<WorkItem> items_;
  const size_t capacity_;
  bool closed_ = false;
};

/**
 * @class ErrorCollector
 * @brief Thread-safe append-only list of failures.
 */
class ErrorCollector {
  std::vector<Error> errors_;
  mutable std::mutex mutex_;

public:
  /// Append one error (any thread)
  void add(Error error);

  size_t size() const;

  /**
   * @brief Extract all collected errors.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<Error> extract();
};

} // namespace replacer

#endif // REPLACER_WORK_QUEUE_HPP
