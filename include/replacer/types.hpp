/**
 * @file types.hpp
 * @brief Core data types and constants for replacer
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Size classification and I/O buffer constants
 *
 *          - WorkItem for the file queues
 *
 *          - Error record shared by the walker, the rewriters and the
 *            dispatcher
 */

#ifndef REPLACER_TYPES_HPP
#define REPLACER_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <fmt/core.h>

namespace replacer {

// **----- CONSTANTS -----**

/**
 * @brief Files strictly larger than this are streamed line by line.
 * @note Everything at or below it is loaded into memory in one piece.
 */
constexpr uint64_t LARGE_FILE_THRESHOLD = 2ULL * 1024 * 1024 * 1024; //< 2GiB

/**
 * @brief Size of the read and write buffers used by the streaming rewriter.
 */
constexpr size_t IO_BUFFER_SIZE = 256 * 1024; //< 256KB

/// Default bound on total run time, in seconds
constexpr long DEFAULT_TIMEOUT_SEC = 3 * 60;

// **----- DATA STRUCTURES -----**

/**
 * @struct WorkItem
 * @brief A regular file discovered by the walker.
 */
struct WorkItem {
  std::string path; //< Path as produced by the walk
  uint64_t size;    //< Size at discovery time
};

/**
 * @brief Classes of failure collected during a run.
 */
enum class ErrorKind {
  Traversal,        //< stat/readdir failure on a single entry
  Cancelled,        //< interrupt received
  DeadlineExceeded, //< timeout expired
  Io                //< open/read/write/rename failure on one file
};

/**
 * @struct Error
 * @brief A single collected failure.
 * @note path is empty for run-wide errors such as cancellation.
 */
struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string path;
  std::string message;
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Traversal:
    return "traversal";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::DeadlineExceeded:
    return "deadline";
  case ErrorKind::Io:
    return "io";
  }
  return "unknown";
}

/// True for the two kinds produced by a fired CancellationToken
inline bool is_cancellation(const Error &error) {
  return error.kind == ErrorKind::Cancelled ||
         error.kind == ErrorKind::DeadlineExceeded;
}

/// Render an error as a single printable line
inline std::string format_error(const Error &error) {
  if (error.path.empty())
    return fmt::format("[{}] {}", to_string(error.kind), error.message);
  return fmt::format("[{}] {}: {}", to_string(error.kind), error.path,
                     error.message);
}

} // namespace replacer

#endif // REPLACER_TYPES_HPP
