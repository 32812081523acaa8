/**
 * @file main.cpp
 * @brief Entry point for replacer
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Signal and deadline setup
 *
 *          - Running the Dispatcher and printing the summary
 *
 * @note Exit status is 0 even when errors were collected unless --strict
 *       is given. A wrong number of positional arguments prints usage and
 *       exits 0 without doing any work.
 */

#include <chrono>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include "replacer/cancellation.hpp"
#include "replacer/config.hpp"
#include "replacer/dispatcher.hpp"
#include "replacer/logging.hpp"
#include "replacer/system.hpp"

using namespace replacer;

namespace {

constexpr const char *USAGE =
    "Usage: replacer [--timeout <duration>] [--strict] [--verbose] "
    "<search> <replace> <path>";

struct CliOptions {
  std::vector<std::string> positional;
  std::string timeout;
  bool timeout_set = false;
  bool strict = false;
  bool verbose = false;
  bool help = false;
};

/// Returns false when a flag is malformed
bool parse_args(int argc, char *argv[], CliOptions &cli) {
  bool flags_done = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (flags_done || arg.size() < 2 || arg[0] != '-') {
      cli.positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      flags_done = true;
      continue;
    }

    /// Accept both -flag and --flag
    std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
    std::string value;
    bool has_value = false;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
      has_value = true;
    }

    if (name == "timeout") {
      if (!has_value) {
        if (i + 1 >= argc) {
          LOG_ERROR("--timeout requires a value");
          return false;
        }
        value = argv[++i];
      }
      cli.timeout = value;
      cli.timeout_set = true;
    } else if (name == "strict" && !has_value) {
      cli.strict = true;
    } else if (name == "verbose" && !has_value) {
      cli.verbose = true;
    } else if ((name == "h" || name == "help") && !has_value) {
      cli.help = true;
    } else {
      /// Unknown dash-prefixed words are data (e.g. a search for "-x")
      cli.positional.push_back(arg);
    }
  }
  return true;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  CliOptions cli;
  if (!parse_args(argc, argv, cli)) {
    LOG_WARN("{}", USAGE);
    return 2;
  }
  if (cli.help || cli.positional.size() != 3) {
    LOG_WARN("{}", USAGE);
    return 0;
  }

  RunOptions options;
  int num_workers = 0;
  std::string timeout_text;
  try {
    set_verbose(cli.verbose || Config::verbose());
    num_workers = Config::workers();
    options.large_file_threshold = Config::large_file_threshold();
    int capacity = Config::queue_capacity();
    options.queue_capacity = capacity > 0 ? static_cast<size_t>(capacity) : 0;
    timeout_text = cli.timeout_set ? cli.timeout : Config::timeout();
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid REPLACER_* environment setting: {}", e.what());
    return 2;
  }

  std::chrono::nanoseconds timeout;
  if (!parse_duration(timeout_text, timeout)) {
    LOG_ERROR("Invalid timeout \"{}\" (units required, e.g. 90s, 3m, 1m30s)",
              timeout_text);
    return 2;
  }

  options.search = cli.positional[0];
  options.replace = cli.positional[1];
  options.root = cli.positional[2];

  install_signal_handlers();
  CancellationToken cancel(timeout, /*observe_signals=*/true);

  LOG_INFO("replacer - timeout {}", timeout_text);

  Dispatcher dispatcher(num_workers);
  RunReport report = dispatcher.run(options, cancel);

  print_run_summary(report);
  TimingCollector::print_summary();

  if (report.errors.empty()) {
    LOG_SUCCESS("Done: {} file(s) rewritten", report.rewritten);
  } else {
    LOG_WARN("Done with {} error(s)", report.errors.size());
  }

  return (cli.strict && !report.errors.empty()) ? 1 : 0;
}
