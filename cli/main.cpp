#include "lineshuf/cancellation.hpp"
#include "lineshuf/errors.hpp"
#include "lineshuf/options.hpp"
#include "lineshuf/pipeline.hpp"
#include "lineshuf/progress.hpp"
#include "lineshuf/report.hpp"
#include "lineshuf/status_console.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include <unistd.h>

using namespace lineshuf;

namespace {

constexpr const char* kVersion = "lineshuf 1.0";

std::atomic<CancellationToken*> g_cancel{nullptr};
static_assert(std::atomic<CancellationToken*>::is_always_lock_free);

void HandleSignal(int) {
  if (CancellationToken* cancel = g_cancel.load()) {
    cancel->RequestCancel();
  }
}

struct Args {
  std::string env_file = ".env";
  std::string input;
  std::string output;
  std::optional<std::size_t> chunk_records;
  std::optional<std::size_t> chunk_bytes;
  std::optional<std::string> temp_dir;
  std::optional<std::uint64_t> seed;
  std::optional<std::size_t> threads;
  std::optional<std::size_t> max_memory_mb;
  std::optional<std::string> report_path;
  bool status = true;
  bool quiet = false;
};

void PrintUsage() {
  std::cerr << "Shuffle the lines of a file too large for memory\n"
            << "Usage:\n"
            << "  lineshuf [options] <input> <output>\n\n"
            << "Options:\n"
            << "  --chunk-records <n>   Lines per chunk (default: 1000000, 0=no limit)\n"
            << "  --chunk-bytes <n>     Bytes per chunk (default: 0=no limit)\n"
            << "  --temp-dir <path>     Directory for chunk files (default: system temp)\n"
            << "  --seed <n>            Seed for a reproducible shuffle\n"
            << "  --threads <n>         Shuffle worker threads (0=auto)\n"
            << "  --max-memory-mb <n>   Memory ceiling for chunks in flight (default: 0=unlimited)\n"
            << "  --env-file <path>     Path to .env (default: .env)\n"
            << "  --report <path>       Write a JSON run report\n"
            << "  --no-status           Do not listen for Enter on stdin\n"
            << "  --quiet               Only print errors\n"
            << "  --version             Show the version and exit\n"
            << "  --help                Show this help\n\n"
            << "Press Enter while running to print the current status.\n";
}

// Returns 0 to continue, -1 to exit successfully (help/version), or an exit code.
int ParseArgs(int argc, char** argv, Args& args) {
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto need_value = [&](const std::string& name) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    auto size_value = [&](const std::string& name, std::optional<std::size_t>& out) -> bool {
      const char* v = need_value(name);
      std::size_t x = 0;
      if (!v || !ParseSizeArg(v, x)) {
        if (v) {
          std::cerr << "Invalid " << name << ": " << v << "\n";
        }
        return false;
      }
      out = x;
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return -1;
    } else if (arg == "--version") {
      std::cout << kVersion << "\n";
      return -1;
    } else if (arg == "--chunk-records" || arg == "--chunk_size") {
      if (!size_value(arg, args.chunk_records)) return 1;
    } else if (arg == "--chunk-bytes") {
      if (!size_value(arg, args.chunk_bytes)) return 1;
    } else if (arg == "--threads") {
      if (!size_value(arg, args.threads)) return 1;
    } else if (arg == "--max-memory-mb") {
      if (!size_value(arg, args.max_memory_mb)) return 1;
    } else if (arg == "--seed") {
      const char* v = need_value(arg);
      std::uint64_t x = 0;
      if (!v) return 1;
      if (!ParseU64Arg(v, x)) {
        std::cerr << "Invalid --seed: " << v << "\n";
        return 1;
      }
      args.seed = x;
    } else if (arg == "--temp-dir") {
      const char* v = need_value(arg);
      if (!v) return 1;
      args.temp_dir = v;
    } else if (arg == "--env-file") {
      const char* v = need_value(arg);
      if (!v) return 1;
      args.env_file = v;
    } else if (arg == "--report") {
      const char* v = need_value(arg);
      if (!v) return 1;
      args.report_path = v;
    } else if (arg == "--no-status") {
      args.status = false;
    } else if (arg == "--quiet" || arg == "-q") {
      args.quiet = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown argument: " << arg << "\n";
      return 1;
    } else if (positional == 0) {
      args.input = arg;
      ++positional;
    } else if (positional == 1) {
      args.output = arg;
      ++positional;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      return 1;
    }
  }
  if (positional != 2) {
    PrintUsage();
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  int rc = ParseArgs(argc, argv, args);
  if (rc != 0) {
    return rc < 0 ? 0 : rc;
  }

  ShuffleOptions options;
  try {
    ApplyEnvOverrides(options, ReadEnvFile(args.env_file));
  } catch (const ShuffleError& e) {
    std::cerr << args.env_file << ": " << e.what() << "\n";
    return ExitCodeFor(e.kind());
  }
  if (args.max_memory_mb) {
    try {
      options.max_memory_bytes = MegabytesToBytes(*args.max_memory_mb);
    } catch (const ShuffleError& e) {
      std::cerr << "Invalid --max-memory-mb: " << e.what() << "\n";
      return ExitCodeFor(e.kind());
    }
  }
  if (args.chunk_records) options.chunk_records = *args.chunk_records;
  if (args.chunk_bytes) options.chunk_bytes = *args.chunk_bytes;
  if (args.temp_dir) options.temp_dir = *args.temp_dir;
  if (args.seed) options.seed = *args.seed;
  if (args.threads) options.num_threads = *args.threads;
  if (args.report_path) options.report_path = *args.report_path;
  options.output_path = args.output;
  options.verbose = !args.quiet;

  CancellationToken cancel;
  g_cancel.store(&cancel);
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  ProgressMonitor progress;
  StatusConsole console(progress, std::cout, STDIN_FILENO);
  if (args.status && ::isatty(STDIN_FILENO)) {
    if (!args.quiet) {
      std::cerr << "Press Enter at any time to show program status.\n";
    }
    console.Start();
  }

  int exit_code = 0;
  try {
    ShufflePipeline pipeline(options, progress, cancel);
    RunSummary summary = pipeline.Run(args.input);
    if (!options.report_path.empty()) {
      WriteRunReport(summary, options.report_path);
    }
    if (!args.quiet) {
      std::cerr << "Finished! Output file saved to: " << summary.output_path << "\n";
    }
  } catch (const ShuffleError& e) {
    std::cerr << "lineshuf: " << e.what() << "\n";
    exit_code = ExitCodeFor(e.kind());
  } catch (const std::exception& e) {
    std::cerr << "lineshuf: " << e.what() << "\n";
    exit_code = ExitCodeFor(ErrorKind::kInternal);
  }

  console.Stop();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_cancel.store(nullptr);
  return exit_code;
}
