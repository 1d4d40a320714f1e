#include "lineshuf/errors.hpp"

namespace lineshuf {

namespace {
std::string ComposeMessage(Stage stage, const std::string& message,
                           std::optional<std::size_t> chunk) {
  std::string out(StageName(stage));
  out += " failed";
  if (chunk) {
    out += " at chunk " + std::to_string(*chunk);
  }
  out += ": ";
  out += message;
  return out;
}
}  // namespace

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kIoFailure:
      return "io_failure";
    case ErrorKind::kMemoryExceeded:
      return "memory_exceeded";
    case ErrorKind::kInterruptRequested:
      return "interrupt_requested";
    case ErrorKind::kConfigInvalid:
      return "config_invalid";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "unknown";
}

std::string_view StageName(Stage stage) {
  switch (stage) {
    case Stage::kSetup:
      return "setup";
    case Stage::kSplit:
      return "split";
    case Stage::kShuffle:
      return "shuffle";
    case Stage::kMerge:
      return "merge";
    case Stage::kCleanup:
      return "cleanup";
    case Stage::kReport:
      return "report";
  }
  return "unknown";
}

ShuffleError::ShuffleError(ErrorKind kind, Stage stage, const std::string& message,
                           std::optional<std::size_t> chunk)
    : std::runtime_error(ComposeMessage(stage, message, chunk)),
      kind_(kind),
      stage_(stage),
      chunk_(chunk) {}

int ExitCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfigInvalid:
      return 1;
    case ErrorKind::kIoFailure:
      return 2;
    case ErrorKind::kMemoryExceeded:
      return 3;
    case ErrorKind::kInterruptRequested:
      return 130;
    case ErrorKind::kInternal:
      return 4;
  }
  return 4;
}

}  // namespace lineshuf
