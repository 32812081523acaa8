/**
 * @file file_io.hpp
 * @brief POSIX file primitives used by the rewriters
 *
 * @details Provides:
 *          - MappedFile / MemoryLoader: whole-file read through mmap
 *
 *          - LineReader: buffered '\n'-delimited reader for streaming
 *
 *          - TempFile: sibling temporary file with buffered writes and
 *            atomic rename into place
 *
 * All failures are reported as bool + Error with the errno message.
 */

#ifndef REPLACER_FILE_IO_HPP
#define REPLACER_FILE_IO_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

#include "types.hpp"

namespace replacer {

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Handles automatic cleanup (munmap/close) on destruction.
 *       Supports move semantics but not copy. An empty file is valid and
 *       has no mapping.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  /// Disable copy
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  /// Enable move
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const char *data() const { return data_; }
  size_t size() const { return size_; }
  mode_t mode() const { return mode_; }
  bool is_open() const { return fd_ != -1; }

private:
  friend class MemoryLoader;
  void reset();

  char *data_ = nullptr;
  size_t size_ = 0;
  mode_t mode_ = 0;
  int fd_ = -1;
};

/**
 * @class MemoryLoader
 * @brief Loads whole files into memory for the in-memory rewrite.
 */
class MemoryLoader {
public:
  /**
   * @brief Map an entire file into memory using mmap.
   * @param path Path to the file
   * @param file Output MappedFile object (takes ownership of the mapping)
   * @param writable Open read-write so a file we may not modify fails early
   * @param error Filled on failure
   * @return true on success, false on failure
   */
  static bool load_file(const std::string &path, MappedFile &file,
                        bool writable, Error &error);
};

/**
 * @class LineReader
 * @brief Buffered reader returning '\n'-delimited lines.
 * @note The delimiter is stripped. A final line without a trailing newline
 *       is still returned. '\r' is ordinary data.
 */
class LineReader {
public:
  LineReader() = default;
  ~LineReader();

  LineReader(const LineReader &) = delete;
  LineReader &operator=(const LineReader &) = delete;

  /**
   * @brief Open a file read-only.
   * @return true on success, false with error filled on failure
   */
  bool open(const std::string &path, Error &error);

  /**
   * @brief Read the next line.
   * @param line Output: line contents without the delimiter
   * @return true if a line was read; false at end of file or on error
   *         (check failed())
   */
  bool next(std::string &line);

  bool failed() const { return failed_; }
  const Error &error() const { return error_; }

  /// Permission bits of the open file
  mode_t mode() const { return mode_; }

  void close();

private:
  std::string path_;
  std::vector<char> buffer_;
  size_t pos_ = 0;
  size_t len_ = 0;
  int fd_ = -1;
  mode_t mode_ = 0;
  bool eof_ = false;
  bool failed_ = false;
  Error error_;
};

/**
 * @class TempFile
 * @brief Temporary file created next to a target path.
 *
 * @attention LIFECYCLE:
 *
 * - create_beside() makes "<dir>/.<name>.replacer-XXXXXX" with mkstemp
 *
 * - write() goes through an IO_BUFFER_SIZE buffer
 *
 * - commit() flushes, fsyncs, closes and renames over the target
 *
 * - anything not committed is unlinked by the destructor
 */
class TempFile {
public:
  TempFile() = default;
  ~TempFile();

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  /**
   * @brief Create a temporary file in the same directory as target.
   * @note Same directory keeps the final rename on one filesystem.
   */
  bool create_beside(const std::string &target, Error &error);

  /// Apply permission bits (typically copied from the file being replaced)
  bool set_mode(mode_t mode, Error &error);

  /// Buffered write
  bool write(const char *data, size_t size, Error &error);

  /**
   * @brief Flush, close and atomically rename over target.
   * @note After a successful commit the temporary path no longer exists.
   */
  bool commit(const std::string &target, Error &error);

  /// Close and unlink without renaming
  void discard();

  const std::string &path() const { return path_; }

private:
  bool flush(Error &error);
  Error io_error(const char *what, int err) const;

  std::string target_;
  std::string path_;
  std::vector<char> buffer_;
  size_t used_ = 0;
  int fd_ = -1;
};

} // namespace replacer

#endif // REPLACER_FILE_IO_HPP
