/**
 * @file cancellation.cpp
 * @brief Cancellation token and signal routing implementation
 */

#include "replacer/cancellation.hpp"

#include <csignal>

#include <signal.h>

namespace replacer {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) { g_interrupted = 1; }

} // anonymous namespace

void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  /// No SA_RESTART: a blocked read should return EINTR and let the caller poll
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

bool interrupt_received() { return g_interrupted != 0; }

CancellationToken::CancellationToken(std::chrono::nanoseconds timeout,
                                     bool observe_signals)
    : observe_signals_(observe_signals) {
  auto now = clock::now();
  if (timeout <= std::chrono::nanoseconds::zero()) {
    state_.store(DEADLINE);
    return;
  }

  /// A budget past the clock's range behaves as "no deadline"
  auto headroom = std::chrono::duration_cast<std::chrono::nanoseconds>(
      clock::time_point::max() - now);
  if (timeout < headroom) {
    has_deadline_ = true;
    deadline_ = now + std::chrono::duration_cast<clock::duration>(timeout);
  }
}

void CancellationToken::cancel() const { latch(CANCELLED); }

void CancellationToken::latch(State reason) const {
  int expected = LIVE;
  state_.compare_exchange_strong(expected, reason);
}

bool CancellationToken::fired() const {
  if (state_.load() != LIVE)
    return true;

  if (observe_signals_ && interrupt_received()) {
    latch(CANCELLED);
    return true;
  }
  if (has_deadline_ && clock::now() >= deadline_) {
    latch(DEADLINE);
    return true;
  }
  return false;
}

bool CancellationToken::poll(Error &error) const {
  if (!fired())
    return false;

  if (state_.load() == DEADLINE) {
    error = Error{ErrorKind::DeadlineExceeded, "", "deadline exceeded"};
  } else {
    error = Error{ErrorKind::Cancelled, "", "operation cancelled"};
  }
  return true;
}

} // namespace replacer
