/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker pool sizing
 *
 *          - Duration parsing and formatting
 */

#include "replacer/system.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace replacer {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to count CPUs in a cpuset string like "0,2,4,6,8" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find_first_of(",-", pos);
    if (end == std::string::npos)
      end = line.size();

    char *parse_end = nullptr;
    std::string first = line.substr(pos, end - pos);
    long start_cpu = std::strtol(first.c_str(), &parse_end, 10);
    if (parse_end == first.c_str())
      return -1;

    if (end < line.size() && line[end] == '-') {
      /// Range like "0-3"
      pos = end + 1;
      end = line.find(',', pos);
      if (end == std::string::npos)
        end = line.size();
      std::string last = line.substr(pos, end - pos);
      long end_cpu = std::strtol(last.c_str(), &parse_end, 10);
      if (parse_end == last.c_str() || end_cpu < start_cpu)
        return -1;
      count += static_cast<int>(end_cpu - start_cpu + 1);
    } else {
      ++count;
    }

    pos = (end < line.size()) ? end + 1 : line.size();
  }
  return count > 0 ? count : -1;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  return count_cpuset_string(line);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_worker_count(int configured) {
  int available = detect_cpu_limit();

  /// Auto-detect: one worker per available CPU
  if (configured <= 0) {
    return std::max(1, available);
  }

  /// User configured: take minimum of configured and available
  return std::max(1, std::min(configured, available));
}

// **---- Durations ----**

bool parse_duration(const std::string &text, std::chrono::nanoseconds &out) {
  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }
  if (pos == text.size())
    return false;

  const size_t first = pos;
  double total_ns = 0;
  while (pos < text.size()) {
    size_t start = pos;
    while (pos < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[pos])) ||
            text[pos] == '.'))
      ++pos;
    if (pos == start)
      return false;

    char *parse_end = nullptr;
    std::string number = text.substr(start, pos - start);
    double value = std::strtod(number.c_str(), &parse_end);
    if (parse_end != number.c_str() + number.size())
      return false;

    size_t unit_start = pos;
    while (pos < text.size() &&
           std::isalpha(static_cast<unsigned char>(text[pos])))
      ++pos;
    std::string unit = text.substr(unit_start, pos - unit_start);

    double scale;
    if (unit.empty()) {
      /// A unitless value is only accepted for zero
      if (start != first || pos != text.size() || value != 0)
        return false;
      scale = 1;
    } else if (unit == "ns") {
      scale = 1;
    } else if (unit == "us") {
      scale = 1e3;
    } else if (unit == "ms") {
      scale = 1e6;
    } else if (unit == "s") {
      scale = 1e9;
    } else if (unit == "m") {
      scale = 60e9;
    } else if (unit == "h") {
      scale = 3600e9;
    } else {
      return false;
    }
    total_ns += value * scale;
  }

  /// Saturate instead of overflowing the representation
  const double max_ns =
      static_cast<double>(std::chrono::nanoseconds::max().count());
  if (total_ns >= max_ns) {
    out = negative ? std::chrono::nanoseconds::min()
                   : std::chrono::nanoseconds::max();
    return true;
  }

  out = std::chrono::nanoseconds(
      static_cast<std::chrono::nanoseconds::rep>(negative ? -total_ns
                                                          : total_ns));
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string errno_message(int err) {
  return std::generic_category().message(err);
}

} // namespace replacer
