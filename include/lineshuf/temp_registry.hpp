#pragma once

#include <filesystem>
#include <mutex>
#include <ostream>
#include <vector>

namespace lineshuf {

// Owns every temporary path a run creates. Paths are registered before the file
// exists, so a crash between create and write still leaves something to remove.
class TempFileRegistry {
 public:
  explicit TempFileRegistry(std::ostream* log = nullptr);
  ~TempFileRegistry();

  TempFileRegistry(const TempFileRegistry&) = delete;
  TempFileRegistry& operator=(const TempFileRegistry&) = delete;

  // Creates lineshuf-<pid>-<random> under parent and registers it.
  const std::filesystem::path& CreateRunDirectory(const std::filesystem::path& parent);

  void Register(const std::filesystem::path& path);
  // Removes the file now and stops tracking it.
  void Release(const std::filesystem::path& path);
  // Stops tracking without removing (the file was renamed to a permanent name).
  void Forget(const std::filesystem::path& path);

  // Removes every registered file, then the run directory. Safe to call repeatedly.
  void CleanupAll() noexcept;

  [[nodiscard]] std::vector<std::filesystem::path> RegisteredPaths() const;
  [[nodiscard]] const std::filesystem::path& run_directory() const { return run_dir_; }

 private:
  void RemoveQuietly(const std::filesystem::path& path) noexcept;

  mutable std::mutex mu_;
  std::vector<std::filesystem::path> paths_;
  std::filesystem::path run_dir_;
  std::ostream* log_;
};

}  // namespace lineshuf
