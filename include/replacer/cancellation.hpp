/**
 * @file cancellation.hpp
 * @brief One-shot cancellation signal shared by the walker and all workers
 *
 * @details A CancellationToken fires when any of the following happens:
 *
 *          - its deadline passes (reported as ErrorKind::DeadlineExceeded)
 *
 *          - SIGINT/SIGTERM arrives and the token observes signals
 *            (reported as ErrorKind::Cancelled)
 *
 *          - cancel() is called (reported as ErrorKind::Cancelled)
 *
 *          The first reason observed is latched; the token never resets.
 *
 * @note Observation is cooperative. Callers poll at unit boundaries
 *       (one directory entry, one queue item, one line).
 */

#ifndef REPLACER_CANCELLATION_HPP
#define REPLACER_CANCELLATION_HPP

#include <atomic>
#include <chrono>

#include "types.hpp"

namespace replacer {

// **---- Process signals ----**

/**
 * @brief Route SIGINT and SIGTERM into a process-wide interrupt flag.
 * @note Safe to call more than once.
 */
void install_signal_handlers();

/// True once SIGINT or SIGTERM was delivered after install_signal_handlers()
bool interrupt_received();

// **---- CancellationToken ----**

/**
 * @class CancellationToken
 * @brief Monotonic, thread-safe cancellation signal.
 * @note Shared by const reference; polling from any thread is safe.
 */
class CancellationToken {
public:
  using clock = std::chrono::steady_clock;

  /// A token with no deadline that fires only through cancel()
  CancellationToken() = default;

  /**
   * @brief A token that expires timeout after construction.
   * @param timeout Time budget; zero or negative expires immediately
   * @param observe_signals Also fire on SIGINT/SIGTERM
   */
  explicit CancellationToken(std::chrono::nanoseconds timeout,
                             bool observe_signals = false);

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /// Fire the token manually
  void cancel() const;

  /// True if the token has fired
  bool fired() const;

  /**
   * @brief Poll the token.
   * @param error Filled with the cancellation reason when fired
   * @return true if the token has fired
   */
  bool poll(Error &error) const;

private:
  enum State : int { LIVE = 0, CANCELLED = 1, DEADLINE = 2 };

  void latch(State reason) const;

  bool has_deadline_ = false;
  clock::time_point deadline_{};
  bool observe_signals_ = false;
  mutable std::atomic<int> state_{LIVE};
};

} // namespace replacer

#endif // REPLACER_CANCELLATION_HPP
