#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "lineshuf/chunk.hpp"

namespace lineshuf {

class CancellationToken;
class ProgressMonitor;
class TempFileRegistry;

struct ChunkShufflerOptions {
  std::size_t max_chunk_memory_bytes = 0;  // 0 -> unbounded
  std::size_t memory_limit_bytes = 0;      // bounds concurrent chunks, 0 -> unbounded
  std::size_t num_threads = 0;             // 0 -> hardware concurrency
};

// In-place Fisher-Yates; every permutation is equally likely for a uniform engine.
template <typename T, typename Engine>
void FisherYatesShuffle(std::vector<T>& items, Engine& rng) {
  if (items.size() < 2) {
    return;
  }
  for (std::size_t i = items.size() - 1; i > 0; --i) {
    std::uniform_int_distribution<std::size_t> pick(0, i);
    std::size_t j = pick(rng);
    if (j != i) {
      std::swap(items[i], items[j]);
    }
  }
}

class ChunkShuffler {
 public:
  using ChunkCallback = std::function<void(const Chunk&)>;

  ChunkShuffler(ChunkShufflerOptions options, TempFileRegistry& registry,
                ProgressMonitor* progress = nullptr, const CancellationToken* cancel = nullptr);

  void set_on_chunk_begin(ChunkCallback cb) { on_chunk_begin_ = std::move(cb); }

  // Shuffles one kWritten chunk and rewrites its file. On error the chunk is kFailed.
  void Shuffle(Chunk& chunk, std::mt19937_64& rng) const;

  // Shuffles every chunk on a bounded worker pool. Seeds for each chunk come from rng
  // in index order. Rethrows the first failure after the pool drains.
  void ShuffleAll(std::vector<Chunk>& chunks, std::mt19937_64& rng) const;

  // Number of chunks that may be materialized at once.
  [[nodiscard]] std::size_t ConcurrencyFor(const std::vector<Chunk>& chunks) const;

  [[nodiscard]] static std::uint64_t EstimateMemory(const Chunk& chunk);

 private:
  [[nodiscard]] std::vector<std::string> Load(const Chunk& chunk) const;
  void Store(const Chunk& chunk, const std::vector<std::string>& records) const;

  ChunkShufflerOptions options_;
  TempFileRegistry& registry_;
  ProgressMonitor* progress_;
  const CancellationToken* cancel_;
  ChunkCallback on_chunk_begin_;
};

}  // namespace lineshuf
