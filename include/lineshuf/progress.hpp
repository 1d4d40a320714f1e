#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace lineshuf {

enum class ProgressStage : std::uint8_t {
  kIdle,
  kSplitting,
  kShuffling,
  kMerging,
  kDone,
  kFailed,
};

struct ProgressSnapshot {
  ProgressStage stage = ProgressStage::kIdle;
  std::uint64_t total_bytes = 0;
  std::uint64_t bytes_read = 0;
  std::uint64_t records_read = 0;
  std::uint64_t chunk_count = 0;
  std::uint64_t chunks_written = 0;
  std::uint64_t chunks_shuffled = 0;
  std::uint64_t records_merged = 0;
  std::uint64_t bytes_written = 0;
  double elapsed_seconds = 0.0;
};

// Counters written by the pipeline and read by whoever asks. Every member is an
// independent relaxed atomic; a snapshot may mix values from neighbouring updates but
// each counter only grows between two calls to Start.
class ProgressMonitor {
 public:
  ProgressMonitor();

  ProgressMonitor(const ProgressMonitor&) = delete;
  ProgressMonitor& operator=(const ProgressMonitor&) = delete;

  // Begins a run: zeroes every counter and restarts the clock.
  void Start(std::uint64_t total_bytes);
  void SetStage(ProgressStage stage);
  void SetChunkCount(std::uint64_t chunks);

  void AddRead(std::uint64_t bytes, std::uint64_t records);
  void AddChunkWritten();
  void AddChunkShuffled();
  void AddMerged(std::uint64_t bytes, std::uint64_t records);

  [[nodiscard]] ProgressSnapshot Snapshot() const;
  [[nodiscard]] std::string FormatSnapshot() const;

 private:
  std::atomic<ProgressStage> stage_{ProgressStage::kIdle};
  std::atomic<std::uint64_t> total_bytes_{0};
  std::atomic<std::uint64_t> bytes_read_{0};
  std::atomic<std::uint64_t> records_read_{0};
  std::atomic<std::uint64_t> chunk_count_{0};
  std::atomic<std::uint64_t> chunks_written_{0};
  std::atomic<std::uint64_t> chunks_shuffled_{0};
  std::atomic<std::uint64_t> records_merged_{0};
  std::atomic<std::uint64_t> bytes_written_{0};
  std::atomic<std::int64_t> start_ns_{0};
};

[[nodiscard]] const char* ProgressStageName(ProgressStage stage);
[[nodiscard]] std::string FormatSnapshot(const ProgressSnapshot& snap);
[[nodiscard]] std::string FormatDuration(double seconds);

}  // namespace lineshuf
