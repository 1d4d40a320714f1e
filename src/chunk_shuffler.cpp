#include "lineshuf/chunk_shuffler.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>
#include <utility>

#include "lineshuf/cancellation.hpp"
#include "lineshuf/errors.hpp"
#include "lineshuf/options.hpp"
#include "lineshuf/progress.hpp"
#include "lineshuf/temp_registry.hpp"

namespace lineshuf {

namespace {
constexpr std::uint64_t kCancelCheckInterval = 4096;
}  // namespace

ChunkShuffler::ChunkShuffler(ChunkShufflerOptions options, TempFileRegistry& registry,
                             ProgressMonitor* progress, const CancellationToken* cancel)
    : options_(options), registry_(registry), progress_(progress), cancel_(cancel) {}

std::uint64_t ChunkShuffler::EstimateMemory(const Chunk& chunk) {
  return chunk.bytes + chunk.records * sizeof(std::string);
}

std::size_t ChunkShuffler::ConcurrencyFor(const std::vector<Chunk>& chunks) const {
  if (chunks.empty()) {
    return 0;
  }
  std::size_t k = std::min(EffectiveThreads(options_.num_threads), chunks.size());
  if (options_.memory_limit_bytes > 0) {
    std::uint64_t largest = 0;
    for (const auto& c : chunks) {
      largest = std::max(largest, EstimateMemory(c));
    }
    if (largest > 0) {
      auto fit = static_cast<std::size_t>(options_.memory_limit_bytes / largest);
      k = std::min(k, fit);
    }
  }
  return std::max<std::size_t>(k, 1);
}

std::vector<std::string> ChunkShuffler::Load(const Chunk& chunk) const {
  std::ifstream in(chunk.path, std::ios::binary);
  if (!in) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kShuffle, "cannot open " + chunk.path.string(), chunk.index);
  }
  std::vector<std::string> records;
  records.reserve(static_cast<std::size_t>(chunk.records));
  std::string line;
  while (std::getline(in, line)) {
    records.push_back(std::move(line));
    if (cancel_ && records.size() % kCancelCheckInterval == 0) {
      cancel_->ThrowIfCancelled(Stage::kShuffle, chunk.index);
    }
  }
  if (in.bad()) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kShuffle, "read error on " + chunk.path.string(), chunk.index);
  }
  if (records.size() != chunk.records) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kShuffle,
                       "expected " + std::to_string(chunk.records) + " records in " + chunk.path.string() +
                           ", found " + std::to_string(records.size()),
                       chunk.index);
  }
  return records;
}

void ChunkShuffler::Store(const Chunk& chunk, const std::vector<std::string>& records) const {
  auto tmp = chunk.path;
  tmp.replace_extension(".shuf");
  registry_.Register(tmp);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      registry_.Release(tmp);
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kShuffle, "cannot create " + tmp.string(), chunk.index);
    }
    for (const auto& rec : records) {
      out.write(rec.data(), static_cast<std::streamsize>(rec.size()));
      out.put('\n');
    }
    out.flush();
    if (!out) {
      out.close();
      registry_.Release(tmp);
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kShuffle, "write error on " + tmp.string(), chunk.index);
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, chunk.path, ec);
  if (ec) {
    registry_.Release(tmp);
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kShuffle,
                       "cannot replace " + chunk.path.string() + ": " + ec.message(), chunk.index);
  }
  registry_.Forget(tmp);
}

void ChunkShuffler::Shuffle(Chunk& chunk, std::mt19937_64& rng) const {
  if (chunk.state != ChunkState::kWritten) {
    throw ShuffleError(ErrorKind::kInternal, Stage::kShuffle,
                       "chunk is " + std::string(ChunkStateName(chunk.state)) + ", expected written", chunk.index);
  }
  try {
    if (cancel_) {
      cancel_->ThrowIfCancelled(Stage::kShuffle, chunk.index);
    }
    if (on_chunk_begin_) {
      on_chunk_begin_(chunk);
    }
    const auto need = EstimateMemory(chunk);
    if (options_.max_chunk_memory_bytes > 0 && need > options_.max_chunk_memory_bytes) {
      throw ShuffleError(ErrorKind::kMemoryExceeded, Stage::kShuffle,
                         "chunk needs ~" + std::to_string(need) + " bytes, limit is " +
                             std::to_string(options_.max_chunk_memory_bytes),
                         chunk.index);
    }

    std::vector<std::string> records;
    try {
      records = Load(chunk);
    } catch (const std::bad_alloc&) {
      throw ShuffleError(ErrorKind::kMemoryExceeded, Stage::kShuffle,
                         "out of memory loading " + std::to_string(chunk.records) + " records", chunk.index);
    }
    FisherYatesShuffle(records, rng);
    Store(chunk, records);
  } catch (...) {
    AdvanceState(chunk, ChunkState::kFailed);
    throw;
  }
  AdvanceState(chunk, ChunkState::kShuffled);
  if (progress_) {
    progress_->AddChunkShuffled();
  }
}

void ChunkShuffler::ShuffleAll(std::vector<Chunk>& chunks, std::mt19937_64& rng) const {
  std::vector<std::uint64_t> seeds(chunks.size());
  for (auto& s : seeds) {
    s = rng();
  }

  const std::size_t workers = ConcurrencyFor(chunks);
  if (workers <= 1) {
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      std::mt19937_64 local(seeds[i]);
      Shuffle(chunks[i], local);
    }
    return;
  }

  std::atomic<std::size_t> next_idx{0};
  std::atomic<bool> had_error{false};
  std::mutex err_mu;
  std::exception_ptr first_error;

  auto worker = [&]() {
    while (!had_error.load(std::memory_order_relaxed)) {
      std::size_t idx = next_idx.fetch_add(1, std::memory_order_relaxed);
      if (idx >= chunks.size()) {
        return;
      }
      try {
        std::mt19937_64 local(seeds[idx]);
        Shuffle(chunks[idx], local);
      } catch (...) {
        std::lock_guard<std::mutex> lock(err_mu);
        if (!first_error) {
          first_error = std::current_exception();
        }
        had_error.store(true, std::memory_order_relaxed);
        return;
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t t = 0; t < workers; ++t) {
    pool.emplace_back(worker);
  }
  for (auto& th : pool) {
    th.join();
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace lineshuf
