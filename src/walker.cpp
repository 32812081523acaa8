/**
 * @file walker.cpp
 * @brief Directory traversal implementation
 */

#include "replacer/walker.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "replacer/cancellation.hpp"
#include "replacer/logging.hpp"
#include "replacer/work_queue.hpp"

namespace replacer {

namespace fs = std::filesystem;

Walker::Walker(std::string root, uint64_t threshold,
               const CancellationToken &cancel, WorkQueue &small_queue,
               WorkQueue &large_queue, ErrorCollector &errors)
    : root_(std::move(root)), threshold_(threshold), cancel_(cancel),
      small_queue_(small_queue), large_queue_(large_queue), errors_(errors) {}

bool Walker::run(Error &error) {
  TIMER_START(walk);
  bool ok = walk_tree(error);
  TIMER_END(walk);

  small_queue_.close();
  large_queue_.close();

  LOG_DEBUG("Walk finished: {} dirs, {} small, {} large, {} skipped",
            stats_.directories, stats_.small_files, stats_.large_files,
            stats_.skipped);
  return ok;
}

void Walker::record(const std::string &path, const std::string &message) {
  LOG_DEBUG("Walk error at {}: {}", path, message);
  errors_.add(Error{ErrorKind::Traversal, path, message});
}

bool Walker::walk_tree(Error &error) {
  std::error_code ec;
  fs::file_status root_status = fs::status(root_, ec);
  if (ec) {
    record(root_, ec.message());
    return true;
  }
  if (!fs::is_directory(root_status)) {
    record(root_, "not a directory");
    return true;
  }

  std::vector<fs::path> pending;
  pending.emplace_back(root_);

  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    if (cancel_.poll(error))
      return false;

    fs::directory_iterator it(dir, ec);
    if (ec) {
      record(dir.string(), ec.message());
      ec.clear();
      continue;
    }
    ++stats_.directories;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      if (ec)
        break;
      if (cancel_.poll(error))
        return false;

      const fs::directory_entry &entry = *it;
      LOG_DEBUG("Walking {}", entry.path().string());

      std::error_code entry_ec;
      fs::file_status st = entry.symlink_status(entry_ec);
      if (entry_ec) {
        record(entry.path().string(), entry_ec.message());
        continue;
      }

      if (fs::is_directory(st)) {
        pending.push_back(entry.path());
        continue;
      }
      if (!fs::is_regular_file(st)) {
        ++stats_.skipped;
        continue;
      }

      uintmax_t size = entry.file_size(entry_ec);
      if (entry_ec) {
        record(entry.path().string(), entry_ec.message());
        continue;
      }

      if (!route(WorkItem{entry.path().string(), static_cast<uint64_t>(size)},
                 error))
        return false;
    }

    if (ec) {
      record(dir.string(), ec.message());
      ec.clear();
    }
  }
  return true;
}

bool Walker::route(WorkItem item, Error &error) {
  bool large = item.size > threshold_;
  WorkQueue &queue = large ? large_queue_ : small_queue_;
  if (!queue.push(std::move(item), cancel_)) {
    /// push only fails once the token has fired
    if (!cancel_.poll(error))
      error = Error{ErrorKind::Cancelled, "", "queue closed"};
    return false;
  }
  if (large)
    ++stats_.large_files;
  else
    ++stats_.small_files;
  return true;
}

} // namespace replacer
