#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <utility>
#include <random>
#include <vector>

#include "lineshuf/chunk.hpp"

namespace lineshuf {

class CancellationToken;
class ProgressMonitor;
class TempFileRegistry;

// Remaining record counts per chunk, with weighted lookup in O(log n).
class RemainingCounts {
 public:
  explicit RemainingCounts(const std::vector<std::uint64_t>& counts);

  [[nodiscard]] std::uint64_t total() const { return total_; }
  // Index i such that prefix(i) <= target < prefix(i + 1). Requires target < total().
  [[nodiscard]] std::size_t Find(std::uint64_t target) const;
  void Decrement(std::size_t index);
  [[nodiscard]] std::uint64_t at(std::size_t index) const { return counts_[index]; }

 private:
  std::vector<std::uint64_t> tree_;  // 1-based Fenwick tree
  std::vector<std::uint64_t> counts_;
  std::uint64_t total_ = 0;
  std::size_t top_bit_ = 0;
};

class MergeScheduler {
 public:
  using ChunkCallback = std::function<void(const Chunk&)>;

  MergeScheduler(TempFileRegistry& registry, ProgressMonitor* progress = nullptr,
                 const CancellationToken* cancel = nullptr);

  // Called when a chunk's reader is opened, before any record is drawn.
  void set_on_chunk_begin(ChunkCallback cb) { on_chunk_begin_ = std::move(cb); }

  // Most chunk files open at once. Above this, groups of chunks are first interleaved
  // into intermediate chunks, level by level.
  void set_max_fan_in(std::size_t fan_in) { max_fan_in_ = fan_in < 2 ? 2 : fan_in; }
  [[nodiscard]] std::size_t max_fan_in() const { return max_fan_in_; }

  // Derived from the process open-file limit, at most 256.
  [[nodiscard]] static std::size_t DefaultFanIn();

  // Interleaves shuffled chunks into output_path, drawing each next record from a chunk
  // chosen with probability proportional to its remaining records. Returns records written.
  std::uint64_t Merge(std::vector<Chunk>& chunks, const std::filesystem::path& output_path,
                      std::mt19937_64& rng) const;

 private:
  // Interleaves inputs into out_path (already registered). Exhausted inputs become
  // kMerged and their files are released.
  std::uint64_t Interleave(const std::vector<Chunk*>& inputs, const std::filesystem::path& out_path,
                           std::mt19937_64& rng, bool final_pass) const;

  TempFileRegistry& registry_;
  ProgressMonitor* progress_;
  const CancellationToken* cancel_;
  ChunkCallback on_chunk_begin_;
  std::size_t max_fan_in_;
};

}  // namespace lineshuf
