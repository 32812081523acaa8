#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "replacer/cancellation.hpp"
#include "replacer/rewriter.hpp"
#include "test_helpers.hpp"

using namespace replacer;
using namespace replacer::test;

namespace {

bool write_all(int fd, const std::string &data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

// **---- replace_all ----**

TEST(ReplaceAllTest, ReplacesEveryOccurrence) {
  EXPECT_EQ(replace_all("hello world", "world", "gopher"), "hello gopher");
  EXPECT_EQ(replace_all("foo bar foo", "foo", "baz"), "baz bar baz");
}

TEST(ReplaceAllTest, NoMatchLeavesInputUnchanged) {
  EXPECT_EQ(replace_all("hello world", "gopher", "world"), "hello world");
  EXPECT_EQ(replace_all("", "foo", "bar"), "");
  EXPECT_EQ(replace_all("fo", "foo", "bar"), "fo");
}

TEST(ReplaceAllTest, EmptySearchIsNoOp) {
  std::string out;
  EXPECT_EQ(replace_all("abc", 3, "", "x", out), 0u);
  EXPECT_EQ(out, "abc");
}

TEST(ReplaceAllTest, MatchesAreNonOverlappingLeftToRight) {
  EXPECT_EQ(replace_all("aaa", "aa", "b"), "ba");
  EXPECT_EQ(replace_all("aaaa", "aa", "b"), "bb");
}

TEST(ReplaceAllTest, ReplacementIsNotRescanned) {
  EXPECT_EQ(replace_all("ab", "a", "aa"), "aab");
  EXPECT_EQ(replace_all("abc", "b", ""), "ac");
}

TEST(ReplaceAllTest, IdempotentWhenReplacementHasNoMatch) {
  const std::string input = "one two one three one";
  std::string once = replace_all(input, "one", "1");
  EXPECT_EQ(replace_all(once, "one", "1"), once);
}

TEST(ReplaceAllTest, CountsReplacementsAndHandlesEmbeddedNul) {
  const std::string input("a\0b\0c", 5);
  std::string out;
  EXPECT_EQ(replace_all(input.data(), input.size(), std::string("\0", 1),
                        "-", out),
            2u);
  EXPECT_EQ(out, "a-b-c");
}

// **---- replace_in_file ----**

class SmallFileRewriteTest : public ScratchDirTest {};

TEST_F(SmallFileRewriteTest, Scenarios) {
  struct Case {
    const char *content;
    const char *search;
    const char *replace;
    const char *expected;
  };
  const Case cases[] = {
      {"hello world", "world", "gopher", "hello gopher"},
      {"foo bar foo", "foo", "baz", "baz bar baz"},
      {"hello world", "gopher", "world", "hello world"},
      {"", "foo", "bar", ""},
  };

  for (const auto &c : cases) {
    SCOPED_TRACE(c.content);
    auto path = root_ / "file.txt";
    write_file(path, c.content);

    RewriteResult result;
    Error error;
    ASSERT_TRUE(replace_in_file(path.string(), c.search, c.replace, result,
                                error))
        << format_error(error);
    EXPECT_EQ(read_file(path), c.expected);
    EXPECT_TRUE(hidden_entries(root_).empty());
  }
}

TEST_F(SmallFileRewriteTest, DoesNotAddTrailingNewline) {
  auto path = root_ / "a.txt";
  write_file(path, "x\ny");

  RewriteResult result;
  Error error;
  ASSERT_TRUE(replace_in_file(path.string(), "y", "z", result, error));
  EXPECT_EQ(read_file(path), "x\nz");
  EXPECT_TRUE(result.changed);
  EXPECT_EQ(result.replacements, 1u);
  EXPECT_EQ(result.bytes_written, 3u);
}

TEST_F(SmallFileRewriteTest, NoMatchDoesNotTouchFile) {
  auto path = root_ / "a.txt";
  write_file(path, "unchanged");
  struct stat before;
  ASSERT_EQ(stat(path.c_str(), &before), 0);

  RewriteResult result;
  Error error;
  ASSERT_TRUE(replace_in_file(path.string(), "zzz", "y", result, error));
  EXPECT_FALSE(result.changed);

  struct stat after;
  ASSERT_EQ(stat(path.c_str(), &after), 0);
  EXPECT_EQ(before.st_ino, after.st_ino);
}

TEST_F(SmallFileRewriteTest, PreservesPermissionBits) {
  auto path = root_ / "script.sh";
  write_file(path, "echo old\n");
  ASSERT_EQ(chmod(path.c_str(), 0750), 0);

  RewriteResult result;
  Error error;
  ASSERT_TRUE(replace_in_file(path.string(), "old", "new", result, error));

  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 07777, 0750u);
  EXPECT_EQ(read_file(path), "echo new\n");
}

TEST_F(SmallFileRewriteTest, MissingFileReportsIoError) {
  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_file((root_ / "missing").string(), "a", "b", result,
                               error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(error.path, (root_ / "missing").string());
  EXPECT_NE(error.message.find("open"), std::string::npos);
}

TEST_F(SmallFileRewriteTest, ReadOnlyFileIsRejected) {
  if (geteuid() == 0)
    GTEST_SKIP() << "root bypasses permission bits";

  auto path = root_ / "ro.txt";
  write_file(path, "abc");
  ASSERT_EQ(chmod(path.c_str(), 0444), 0);

  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_file(path.string(), "a", "b", result, error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(read_file(path), "abc");
}

TEST_F(SmallFileRewriteTest, DirectoryIsRejected) {
  fs::create_directory(root_ / "dir");

  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_file((root_ / "dir").string(), "a", "b", result,
                               error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_FALSE(result.changed);
  EXPECT_TRUE(hidden_entries(root_).empty());
}

TEST_F(SmallFileRewriteTest, PathThroughRegularFileIsRejected) {
  write_file(root_ / "plain.txt", "abc");
  auto path = root_ / "plain.txt" / "child";

  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_file(path.string(), "a", "b", result, error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(error.path, path.string());
  EXPECT_NE(error.message.find("open"), std::string::npos);
  EXPECT_EQ(read_file(root_ / "plain.txt"), "abc");
}

// **---- replace_in_large_file ----**

class LargeFileRewriteTest : public ScratchDirTest {};

TEST_F(LargeFileRewriteTest, Scenarios) {
  struct Case {
    std::string content;
    std::string search;
    std::string replace;
    std::string expected;
  };
  const Case cases[] = {
      {"hello world", "world", "gopher", "hello gopher\n"},
      {"foo bar foo", "foo", "baz", "baz bar baz\n"},
      {"hello world", "gopher", "world", "hello world\n"},
      {"", "foo", "bar", ""},
      {build_line_file('a', 1024 * 1024), "a", "b",
       build_line_file('b', 1024 * 1024)},
  };

  for (const auto &c : cases) {
    SCOPED_TRACE(c.search);
    auto path = root_ / "big.txt";
    write_file(path, c.content);

    CancellationToken cancel(std::chrono::minutes(1));
    RewriteResult result;
    Error error;
    ASSERT_TRUE(replace_in_large_file(path.string(), c.search, c.replace,
                                      cancel, result, error))
        << format_error(error);
    EXPECT_EQ(read_file(path), c.expected);
    EXPECT_TRUE(hidden_entries(root_).empty());
  }
}

TEST_F(LargeFileRewriteTest, EveryLineEndsWithOneNewline) {
  auto path = root_ / "lines.txt";
  write_file(path, "a\n\nb\r\nc");

  CancellationToken cancel;
  RewriteResult result;
  Error error;
  ASSERT_TRUE(replace_in_large_file(path.string(), "b", "B", cancel, result,
                                    error));
  EXPECT_EQ(read_file(path), "a\n\nB\r\nc\n");
  EXPECT_EQ(result.replacements, 1u);
  EXPECT_EQ(result.bytes_written, 8u);
}

TEST_F(LargeFileRewriteTest, LinesLongerThanTheReadBuffer) {
  std::string line(IO_BUFFER_SIZE * 2 + 17, 'x');
  line[IO_BUFFER_SIZE] = 'y';
  auto path = root_ / "wide.txt";
  write_file(path, line + "\n" + line);

  CancellationToken cancel;
  RewriteResult result;
  Error error;
  ASSERT_TRUE(replace_in_large_file(path.string(), "y", "Z", cancel, result,
                                    error));
  std::string expected = line;
  expected[IO_BUFFER_SIZE] = 'Z';
  EXPECT_EQ(read_file(path), expected + "\n" + expected + "\n");
  EXPECT_EQ(result.replacements, 2u);
}

TEST_F(LargeFileRewriteTest, ExpiredDeadlineLeavesFileUnchanged) {
  auto path = root_ / "big.txt";
  write_file(path, "hello world");

  CancellationToken cancel(std::chrono::nanoseconds(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(1));

  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_large_file(path.string(), "world", "gopher", cancel,
                                     result, error));
  EXPECT_EQ(error.kind, ErrorKind::DeadlineExceeded);
  EXPECT_EQ(error.path, path.string());
  EXPECT_EQ(read_file(path), "hello world");
  EXPECT_TRUE(hidden_entries(root_).empty());
}

TEST_F(LargeFileRewriteTest, CancelledTokenLeavesNoTempArtifact) {
  auto path = root_ / "big.txt";
  const std::string content = build_line_file('q', 4096);
  write_file(path, content);

  CancellationToken cancel;
  cancel.cancel();

  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_large_file(path.string(), "q", "r", cancel, result,
                                     error));
  EXPECT_EQ(error.kind, ErrorKind::Cancelled);
  EXPECT_FALSE(result.changed);
  EXPECT_EQ(read_file(path), content);
  EXPECT_TRUE(hidden_entries(root_).empty());
}

TEST_F(LargeFileRewriteTest, MissingFileReportsIoError) {
  CancellationToken cancel;
  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_large_file((root_ / "missing").string(), "a", "b",
                                     cancel, result, error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_TRUE(hidden_entries(root_).empty());
}

TEST_F(LargeFileRewriteTest, ReadFailureDiscardsTempFile) {
  /// A directory opens read-only but fails on read(2) with EISDIR
  fs::create_directory(root_ / "dir");

  CancellationToken cancel;
  RewriteResult result;
  Error error;
  EXPECT_FALSE(replace_in_large_file((root_ / "dir").string(), "a", "b",
                                     cancel, result, error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_NE(error.message.find("read"), std::string::npos);
  EXPECT_TRUE(hidden_entries(root_).empty());
  EXPECT_TRUE(fs::is_directory(root_ / "dir"));
}

TEST_F(LargeFileRewriteTest, CancelMidStreamDiscardsPartialOutput) {
  /// The source is a fifo so lines arrive only when the test sends them:
  /// the first batch is consumed with the token live, the second batch only
  /// after it fired.
  auto path = root_ / "stream.txt";
  ASSERT_EQ(mkfifo(path.c_str(), 0644), 0);
  std::signal(SIGPIPE, SIG_IGN);

  CancellationToken cancel;
  std::atomic<bool> temp_seen{false};
  std::thread writer([&] {
    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    int fd = -1;
    while ((fd = ::open(path.c_str(), O_WRONLY | O_NONBLOCK)) == -1 &&
           errno == ENXIO && std::chrono::steady_clock::now() < give_up)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    if (fd == -1) {
      cancel.cancel();
      return;
    }
    fcntl(fd, F_SETFL, 0);

    write_all(fd, build_line_file('a', 64 * 1024));
    while (hidden_entries(root_).empty() &&
           std::chrono::steady_clock::now() < give_up)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    temp_seen = !hidden_entries(root_).empty();

    cancel.cancel();
    /// May fail with EPIPE once the rewriter has stopped reading
    write_all(fd, build_line_file('a', 64 * 1024));
    ::close(fd);
  });

  RewriteResult result;
  Error error;
  bool ok = replace_in_large_file(path.string(), "a", "b", cancel, result,
                                  error);
  writer.join();

  EXPECT_TRUE(temp_seen.load());
  EXPECT_FALSE(ok);
  EXPECT_EQ(error.kind, ErrorKind::Cancelled);
  EXPECT_EQ(error.path, path.string());
  EXPECT_FALSE(result.changed);
  EXPECT_TRUE(hidden_entries(root_).empty());
  /// Not renamed over: the original entry is still the fifo
  EXPECT_TRUE(fs::is_fifo(fs::symlink_status(path)));
}
