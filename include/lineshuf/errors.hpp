#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lineshuf {

enum class ErrorKind {
  kIoFailure,
  kMemoryExceeded,
  kInterruptRequested,
  kConfigInvalid,
  kInternal,
};

enum class Stage {
  kSetup,
  kSplit,
  kShuffle,
  kMerge,
  kCleanup,
  kReport,
};

[[nodiscard]] std::string_view ErrorKindName(ErrorKind kind);
[[nodiscard]] std::string_view StageName(Stage stage);

class ShuffleError : public std::runtime_error {
 public:
  ShuffleError(ErrorKind kind, Stage stage, const std::string& message,
               std::optional<std::size_t> chunk = std::nullopt);

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] Stage stage() const { return stage_; }
  [[nodiscard]] std::optional<std::size_t> chunk() const { return chunk_; }

 private:
  ErrorKind kind_;
  Stage stage_;
  std::optional<std::size_t> chunk_;
};

// Process exit code the CLI uses for an error of this kind.
[[nodiscard]] int ExitCodeFor(ErrorKind kind);

}  // namespace lineshuf
