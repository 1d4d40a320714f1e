#include "lineshuf/progress.hpp"

#include <iomanip>
#include <sstream>

namespace lineshuf {

namespace {

std::int64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

double Percent(std::uint64_t done, std::uint64_t total) {
  return total ? (100.0 * static_cast<double>(done) / static_cast<double>(total)) : 100.0;
}

double MiB(std::uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

}  // namespace

ProgressMonitor::ProgressMonitor() { start_ns_.store(NowNs(), std::memory_order_relaxed); }

void ProgressMonitor::Start(std::uint64_t total_bytes) {
  total_bytes_.store(total_bytes, std::memory_order_relaxed);
  bytes_read_.store(0, std::memory_order_relaxed);
  records_read_.store(0, std::memory_order_relaxed);
  chunk_count_.store(0, std::memory_order_relaxed);
  chunks_written_.store(0, std::memory_order_relaxed);
  chunks_shuffled_.store(0, std::memory_order_relaxed);
  records_merged_.store(0, std::memory_order_relaxed);
  bytes_written_.store(0, std::memory_order_relaxed);
  start_ns_.store(NowNs(), std::memory_order_relaxed);
}

void ProgressMonitor::SetStage(ProgressStage stage) { stage_.store(stage, std::memory_order_relaxed); }

void ProgressMonitor::SetChunkCount(std::uint64_t chunks) {
  chunk_count_.store(chunks, std::memory_order_relaxed);
}

void ProgressMonitor::AddRead(std::uint64_t bytes, std::uint64_t records) {
  bytes_read_.fetch_add(bytes, std::memory_order_relaxed);
  records_read_.fetch_add(records, std::memory_order_relaxed);
}

void ProgressMonitor::AddChunkWritten() {
  chunks_written_.fetch_add(1, std::memory_order_relaxed);
  // chunk_count_ tracks chunks discovered so far while splitting.
  std::uint64_t written = chunks_written_.load(std::memory_order_relaxed);
  std::uint64_t known = chunk_count_.load(std::memory_order_relaxed);
  while (known < written && !chunk_count_.compare_exchange_weak(known, written, std::memory_order_relaxed)) {
  }
}

void ProgressMonitor::AddChunkShuffled() { chunks_shuffled_.fetch_add(1, std::memory_order_relaxed); }

void ProgressMonitor::AddMerged(std::uint64_t bytes, std::uint64_t records) {
  bytes_written_.fetch_add(bytes, std::memory_order_relaxed);
  records_merged_.fetch_add(records, std::memory_order_relaxed);
}

ProgressSnapshot ProgressMonitor::Snapshot() const {
  ProgressSnapshot snap;
  snap.stage = stage_.load(std::memory_order_relaxed);
  snap.total_bytes = total_bytes_.load(std::memory_order_relaxed);
  snap.bytes_read = bytes_read_.load(std::memory_order_relaxed);
  snap.records_read = records_read_.load(std::memory_order_relaxed);
  snap.chunk_count = chunk_count_.load(std::memory_order_relaxed);
  snap.chunks_written = chunks_written_.load(std::memory_order_relaxed);
  snap.chunks_shuffled = chunks_shuffled_.load(std::memory_order_relaxed);
  snap.records_merged = records_merged_.load(std::memory_order_relaxed);
  snap.bytes_written = bytes_written_.load(std::memory_order_relaxed);
  auto start = start_ns_.load(std::memory_order_relaxed);
  snap.elapsed_seconds = static_cast<double>(NowNs() - start) / 1e9;
  return snap;
}

std::string ProgressMonitor::FormatSnapshot() const { return lineshuf::FormatSnapshot(Snapshot()); }

const char* ProgressStageName(ProgressStage stage) {
  switch (stage) {
    case ProgressStage::kIdle:
      return "idle";
    case ProgressStage::kSplitting:
      return "splitting";
    case ProgressStage::kShuffling:
      return "shuffling";
    case ProgressStage::kMerging:
      return "merging";
    case ProgressStage::kDone:
      return "done";
    case ProgressStage::kFailed:
      return "failed";
  }
  return "unknown";
}

std::string FormatDuration(double seconds) {
  int sec = static_cast<int>(seconds + 0.5);
  int h = sec / 3600;
  int m = (sec % 3600) / 60;
  int s = sec % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}

std::string FormatSnapshot(const ProgressSnapshot& snap) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << ProgressStageName(snap.stage) << "]";
  oss << " read " << std::setprecision(1) << MiB(snap.bytes_read) << "/" << MiB(snap.total_bytes) << " MiB ("
      << Percent(snap.bytes_read, snap.total_bytes) << "%)";
  oss << " records " << snap.records_read;

  switch (snap.stage) {
    case ProgressStage::kSplitting:
      oss << " chunk " << snap.chunks_written + 1 << " being written";
      break;
    case ProgressStage::kShuffling:
      oss << " chunks shuffled " << snap.chunks_shuffled << " of " << snap.chunk_count;
      break;
    case ProgressStage::kMerging:
    case ProgressStage::kDone:
      oss << " chunks " << snap.chunk_count << " merged " << snap.records_merged << "/" << snap.records_read
          << " (" << Percent(snap.records_merged, snap.records_read) << "%)";
      break;
    default:
      oss << " chunks " << snap.chunks_written;
      break;
  }

  oss << " elapsed " << FormatDuration(snap.elapsed_seconds);
  if (snap.stage == ProgressStage::kMerging && snap.records_merged > 0 && snap.elapsed_seconds > 0.0) {
    double rate = static_cast<double>(snap.records_merged) / snap.elapsed_seconds;
    if (snap.records_read > snap.records_merged) {
      oss << " ETA " << FormatDuration(static_cast<double>(snap.records_read - snap.records_merged) / rate);
    }
  }
  return oss.str();
}

}  // namespace lineshuf
