#include "lineshuf/temp_registry.hpp"

#include <algorithm>
#include <random>
#include <sstream>
#include <system_error>

#include <unistd.h>

#include "lineshuf/errors.hpp"

namespace lineshuf {

TempFileRegistry::TempFileRegistry(std::ostream* log) : log_(log) {}

TempFileRegistry::~TempFileRegistry() { CleanupAll(); }

const std::filesystem::path& TempFileRegistry::CreateRunDirectory(const std::filesystem::path& parent) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!run_dir_.empty()) {
    return run_dir_;
  }
  std::random_device rd;
  std::error_code ec;
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::ostringstream name;
    name << "lineshuf-" << ::getpid() << "-" << std::hex << rd();
    auto candidate = parent / name.str();
    if (std::filesystem::create_directory(candidate, ec)) {
      run_dir_ = candidate;
      return run_dir_;
    }
    if (ec) {
      break;
    }
  }
  throw ShuffleError(ErrorKind::kIoFailure, Stage::kSetup,
                     "cannot create temp directory under " + parent.string() +
                         (ec ? ": " + ec.message() : std::string()));
}

void TempFileRegistry::Register(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mu_);
  if (std::find(paths_.begin(), paths_.end(), path) == paths_.end()) {
    paths_.push_back(path);
  }
}

void TempFileRegistry::Release(const std::filesystem::path& path) {
  Forget(path);
  RemoveQuietly(path);
}

void TempFileRegistry::Forget(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mu_);
  paths_.erase(std::remove(paths_.begin(), paths_.end(), path), paths_.end());
}

void TempFileRegistry::CleanupAll() noexcept {
  std::vector<std::filesystem::path> paths;
  std::filesystem::path dir;
  {
    std::lock_guard<std::mutex> lock(mu_);
    paths.swap(paths_);
    dir.swap(run_dir_);
  }
  for (const auto& p : paths) {
    RemoveQuietly(p);
  }
  if (!dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec && log_) {
      *log_ << "[cleanup] failed to remove " << dir.string() << ": " << ec.message() << "\n";
    }
  }
}

std::vector<std::filesystem::path> TempFileRegistry::RegisteredPaths() const {
  std::lock_guard<std::mutex> lock(mu_);
  return paths_;
}

void TempFileRegistry::RemoveQuietly(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec && log_) {
    *log_ << "[cleanup] failed to remove " << path.string() << ": " << ec.message() << "\n";
  }
}

}  // namespace lineshuf
