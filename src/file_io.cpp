/**
 * @file file_io.cpp
 * @brief POSIX file primitives implementation
 *
 * @details Provides implementations for:
 *
 *          - MappedFile: RAII wrapper for mmap
 *
 *          - MemoryLoader::load_file - Map file into memory
 *
 *          - LineReader - buffered line streaming
 *
 *          - TempFile - sibling temp file with atomic rename
 */

#include "replacer/file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "replacer/logging.hpp"
#include "replacer/system.hpp"

namespace replacer {

namespace fs = std::filesystem;

namespace {

Error make_io_error(const std::string &path, const char *what, int err) {
  return Error{ErrorKind::Io, path,
               fmt::format("{}: {}", what, errno_message(err))};
}

/// Longest file name for which the temp name keeps the original as a hint
constexpr size_t MAX_HINTED_NAME = 200;

} // anonymous namespace

// **---- MappedFile Implementation ----**

MappedFile::~MappedFile() { reset(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), mode_(other.mode_),
      fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    reset();
    data_ = other.data_;
    size_ = other.size_;
    mode_ = other.mode_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedFile::reset() {
  if (data_) {
    munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

// **---- MemoryLoader Implementation ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file,
                             bool writable, Error &error) {
  int fd = ::open(path.c_str(), (writable ? O_RDWR : O_RDONLY) | O_CLOEXEC);
  if (fd == -1) {
    error = make_io_error(path, "open", errno);
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    error = make_io_error(path, "stat", errno);
    ::close(fd);
    return false;
  }
  if (!S_ISREG(sb.st_mode)) {
    error = Error{ErrorKind::Io, path, "not a regular file"};
    ::close(fd);
    return false;
  }

  void *addr = nullptr;
  if (sb.st_size > 0) {
    /// MAP_POPULATE reads the whole file in now rather than faulting later
    addr = mmap(nullptr, static_cast<size_t>(sb.st_size), PROT_READ,
                MAP_PRIVATE | MAP_POPULATE, fd, 0);
    if (addr == MAP_FAILED) {
      error = make_io_error(path, "mmap", errno);
      ::close(fd);
      return false;
    }
    madvise(addr, static_cast<size_t>(sb.st_size), MADV_SEQUENTIAL);
  }

  /// Transfer ownership to MappedFile
  file.reset();
  file.data_ = static_cast<char *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);
  file.mode_ = sb.st_mode & 07777;
  file.fd_ = fd;
  return true;
}

// **---- LineReader Implementation ----**

LineReader::~LineReader() { close(); }

bool LineReader::open(const std::string &path, Error &error) {
  close();
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    error = make_io_error(path, "open", errno);
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    error = make_io_error(path, "stat", errno);
    ::close(fd);
    return false;
  }

  path_ = path;
  fd_ = fd;
  mode_ = sb.st_mode & 07777;
  buffer_.resize(IO_BUFFER_SIZE);
  pos_ = len_ = 0;
  eof_ = failed_ = false;
  posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
  return true;
}

bool LineReader::next(std::string &line) {
  line.clear();
  if (fd_ == -1 || failed_)
    return false;

  bool got = false;
  while (true) {
    if (pos_ < len_) {
      const char *start = buffer_.data() + pos_;
      size_t avail = len_ - pos_;
      const void *nl = std::memchr(start, '\n', avail);
      if (nl) {
        size_t n = static_cast<size_t>(static_cast<const char *>(nl) - start);
        line.append(start, n);
        pos_ += n + 1;
        return true;
      }
      line.append(start, avail);
      pos_ = len_;
      got = true;
    }

    if (eof_)
      return got;

    ssize_t n = ::read(fd_, buffer_.data(), buffer_.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error_ = make_io_error(path_, "read", errno);
      failed_ = true;
      return false;
    }
    if (n == 0) {
      eof_ = true;
      return got;
    }
    pos_ = 0;
    len_ = static_cast<size_t>(n);
  }
}

void LineReader::close() {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

// **---- TempFile Implementation ----**

TempFile::~TempFile() { discard(); }

bool TempFile::create_beside(const std::string &target, Error &error) {
  discard();

  fs::path target_path(target);
  fs::path dir = target_path.parent_path();
  if (dir.empty())
    dir = ".";

  std::string name = target_path.filename().string();
  std::string pattern =
      name.size() <= MAX_HINTED_NAME
          ? (dir / ("." + name + ".replacer-XXXXXX")).string()
          : (dir / ".replacer-XXXXXX").string();

  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  int fd = mkstemp(buf.data());
  if (fd == -1) {
    error = make_io_error(target, "create temp file", errno);
    return false;
  }

  target_ = target;
  path_ = buf.data();
  fd_ = fd;
  buffer_.resize(IO_BUFFER_SIZE);
  used_ = 0;
  return true;
}

bool TempFile::set_mode(mode_t mode, Error &error) {
  if (fchmod(fd_, mode) == -1) {
    error = io_error("chmod temp file", errno);
    return false;
  }
  return true;
}

bool TempFile::write(const char *data, size_t size, Error &error) {
  if (fd_ == -1) {
    error = io_error("write", EBADF);
    return false;
  }

  while (size > 0) {
    if (used_ == buffer_.size() && !flush(error))
      return false;
    size_t n = std::min(size, buffer_.size() - used_);
    std::memcpy(buffer_.data() + used_, data, n);
    used_ += n;
    data += n;
    size -= n;
  }
  return true;
}

bool TempFile::flush(Error &error) {
  size_t off = 0;
  while (off < used_) {
    ssize_t n = ::write(fd_, buffer_.data() + off, used_ - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = io_error("write", errno);
      return false;
    }
    off += static_cast<size_t>(n);
  }
  used_ = 0;
  return true;
}

bool TempFile::commit(const std::string &target, Error &error) {
  if (fd_ == -1) {
    error = io_error("commit", EBADF);
    return false;
  }
  if (!flush(error))
    return false;

  if (fsync(fd_) == -1) {
    error = io_error("fsync", errno);
    return false;
  }

  int fd = fd_;
  fd_ = -1;
  if (::close(fd) == -1) {
    error = io_error("close", errno);
    return false;
  }

  if (std::rename(path_.c_str(), target.c_str()) == -1) {
    error = io_error("rename", errno);
    return false;
  }

  LOG_DEBUG("Renamed {} -> {}", path_, target);
  path_.clear();
  return true;
}

void TempFile::discard() {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
  if (!path_.empty()) {
    if (::unlink(path_.c_str()) == -1 && errno != ENOENT) {
      int err = errno;
      LOG_WARN("Failed to remove temp file {}: {}", path_, errno_message(err));
    }
    path_.clear();
  }
  used_ = 0;
}

Error TempFile::io_error(const char *what, int err) const {
  return make_io_error(target_, what, err);
}

} // namespace replacer
