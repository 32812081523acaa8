/**
 * @file dispatcher.cpp
 * @brief Concurrent walk + rewrite orchestration implementation
 *
 * @details Implements the Dispatcher class:
 *
 *          - Walker thread producing into two bounded queues
 *
 *          - Two worker pools draining them concurrently
 *
 *          - Cancellation checks before every claimed item
 *
 *          - Summary output
 */

#include "replacer/dispatcher.hpp"

#include <chrono>
#include <functional>
#include <thread>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "replacer/cancellation.hpp"
#include "replacer/logging.hpp"
#include "replacer/rewriter.hpp"
#include "replacer/system.hpp"
#include "replacer/walker.hpp"
#include "replacer/work_queue.hpp"

namespace replacer {

Dispatcher::Dispatcher(int num_workers)
    : num_workers_(calculate_worker_count(num_workers)) {}

RunReport Dispatcher::run(const RunOptions &options,
                          const CancellationToken &cancel) {
  rewritten_.store(0);
  unchanged_.store(0);
  replacements_.store(0);

  size_t capacity = options.queue_capacity > 0
                        ? options.queue_capacity
                        : static_cast<size_t>(num_workers_);
  WorkQueue small_queue(capacity);
  WorkQueue large_queue(capacity);
  ErrorCollector errors;

  LOG_PHASE("=================== REPLACE RUN ===================");
  LOG_INFO("Root: {}", options.root);
  LOG_INFO("Search: \"{}\" -> \"{}\"", options.search, options.replace);
  LOG_INFO("Workers per queue: {}", num_workers_);
  LOG_INFO("Queue capacity: {}", capacity);
  LOG_INFO("Large file threshold: {} bytes", options.large_file_threshold);
  LOG_PHASE("===================================================");

  if (options.search.empty())
    LOG_WARN("Empty search string: files will be left unchanged");

  auto run_start = std::chrono::high_resolution_clock::now();

  /// Launch walker (producer)
  Walker walker(options.root, options.large_file_threshold, cancel,
                small_queue, large_queue, errors);
  std::thread walk_thread([&walker, &errors]() {
    Error error;
    if (!walker.run(error)) {
      LOG_WARN("[Walker] Stopped early: {}", error.message);
      errors.add(error);
    }
  });

  /// Launch worker pools (consumers)
  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(num_workers_) * 2);
  for (int i = 0; i < num_workers_; ++i) {
    workers.emplace_back(&Dispatcher::worker, this, i, Strategy::InMemory,
                         std::ref(small_queue), std::cref(options),
                         std::cref(cancel), std::ref(errors));
  }
  for (int i = 0; i < num_workers_; ++i) {
    workers.emplace_back(&Dispatcher::worker, this, i, Strategy::Streaming,
                         std::ref(large_queue), std::cref(options),
                         std::cref(cancel), std::ref(errors));
  }

  /// The walker closes both queues on every path, which ends the pools
  walk_thread.join();
  for (auto &w : workers) {
    w.join();
  }

  auto run_end = std::chrono::high_resolution_clock::now();

  RunReport report;
  report.small_files = walker.stats().small_files;
  report.large_files = walker.stats().large_files;
  report.rewritten = rewritten_.load();
  report.unchanged = unchanged_.load();
  report.replacements = replacements_.load();
  report.workers = num_workers_;
  report.wall_clock_sec =
      std::chrono::duration<double>(run_end - run_start).count();
  report.cancelled = cancel.fired();
  report.errors = errors.extract();

  TimingCollector::record(
      "run", static_cast<long>(report.wall_clock_sec * 1000000.0));
  return report;
}

void Dispatcher::worker(int worker_id, Strategy strategy, WorkQueue &queue,
                        const RunOptions &options,
                        const CancellationToken &cancel,
                        ErrorCollector &errors) {
  const char *pool = strategy == Strategy::Streaming ? "Large" : "Small";

  WorkItem item;
  while (queue.pop(item)) {
    Error error;
    if (cancel.poll(error)) {
      LOG_DEBUG("[{} {}] Cancelled before {}", pool, worker_id, item.path);
      errors.add(error);
      return;
    }

    LOG_DEBUG("[{} {}] Processing {}", pool, worker_id, item.path);

    RewriteResult result;
    bool ok = strategy == Strategy::Streaming
                  ? replace_in_large_file(item.path, options.search,
                                          options.replace, cancel, result,
                                          error)
                  : replace_in_file(item.path, options.search, options.replace,
                                    result, error);
    if (!ok) {
      LOG_ERROR("[{} {}] Failed: {}", pool, worker_id, format_error(error));
      bool stop = is_cancellation(error);
      errors.add(std::move(error));
      if (stop)
        return;
      continue;
    }

    if (result.changed) {
      ++rewritten_;
      replacements_ += result.replacements;
      LOG_DEBUG("[{} {}] Rewrote {} ({} replacements)", pool, worker_id,
                item.path, result.replacements);
    } else {
      ++unchanged_;
    }
  }

  LOG_DEBUG("[{} {}] Finished (queue closed)", pool, worker_id);
}

void print_run_summary(const RunReport &report) {
  std::lock_guard<std::mutex> lock(log_mutex);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "==================== RUN SUMMARY ====================\n");
  fmt::print("{:<25} {:>25}\n", "Small files:", report.small_files);
  fmt::print("{:<25} {:>25}\n", "Large files:", report.large_files);
  fmt::print("{:<25} {:>25}\n", "Rewritten:", report.rewritten);
  fmt::print("{:<25} {:>25}\n", "Unchanged:", report.unchanged);
  fmt::print("{:<25} {:>25}\n", "Replacements:", report.replacements);
  fmt::print("{:<25} {:>25}\n", "Errors:", report.errors.size());
  fmt::print("{:<25} {:>25}\n", "Workers per queue:", report.workers);
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:",
             format_time(report.wall_clock_sec));
  if (report.cancelled)
    fmt::print(fg(fmt::color::yellow), "{:<25} {:>25}\n", "Status:",
               "cancelled");
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");

  for (const auto &error : report.errors) {
    fmt::print("{}\n", format_error(error));
  }
  std::fflush(stdout);
}

} // namespace replacer
