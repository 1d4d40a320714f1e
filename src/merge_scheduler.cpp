#include "lineshuf/merge_scheduler.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "lineshuf/cancellation.hpp"
#include "lineshuf/errors.hpp"
#include "lineshuf/progress.hpp"
#include "lineshuf/temp_registry.hpp"

namespace lineshuf {

namespace {
constexpr std::uint64_t kCancelCheckInterval = 4096;
constexpr std::size_t kMaxFanIn = 256;
}  // namespace

RemainingCounts::RemainingCounts(const std::vector<std::uint64_t>& counts)
    : tree_(counts.size() + 1, 0), counts_(counts) {
  const std::size_t n = counts_.size();
  for (std::size_t i = 1; i <= n; ++i) {
    tree_[i] += counts_[i - 1];
    total_ += counts_[i - 1];
    std::size_t parent = i + (i & (~i + 1));
    if (parent <= n) {
      tree_[parent] += tree_[i];
    }
  }
  top_bit_ = 1;
  while (top_bit_ * 2 <= n) {
    top_bit_ *= 2;
  }
}

std::size_t RemainingCounts::Find(std::uint64_t target) const {
  std::size_t pos = 0;
  for (std::size_t step = top_bit_; step > 0; step >>= 1) {
    if (pos + step < tree_.size() && tree_[pos + step] <= target) {
      pos += step;
      target -= tree_[pos];
    }
  }
  return pos;
}

void RemainingCounts::Decrement(std::size_t index) {
  counts_[index] -= 1;
  total_ -= 1;
  for (std::size_t i = index + 1; i < tree_.size(); i += i & (~i + 1)) {
    tree_[i] -= 1;
  }
}

MergeScheduler::MergeScheduler(TempFileRegistry& registry, ProgressMonitor* progress,
                               const CancellationToken* cancel)
    : registry_(registry), progress_(progress), cancel_(cancel), max_fan_in_(DefaultFanIn()) {}

std::size_t MergeScheduler::DefaultFanIn() {
  long open_max = ::sysconf(_SC_OPEN_MAX);
  if (open_max <= 0) {
    return kMaxFanIn;
  }
  return std::clamp<std::size_t>(static_cast<std::size_t>(open_max) / 4, 2, kMaxFanIn);
}

std::uint64_t MergeScheduler::Interleave(const std::vector<Chunk*>& inputs, const std::filesystem::path& out_path,
                                         std::mt19937_64& rng, bool final_pass) const {
  std::uint64_t expected = 0;
  for (const Chunk* c : inputs) {
    expected += c->records;
  }

  std::size_t current = 0;
  auto io_error = [&](const std::string& what) {
    return ShuffleError(ErrorKind::kIoFailure, Stage::kMerge, what, inputs[current]->index);
  };

  std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kMerge, "cannot create " + out_path.string());
  }

  std::vector<std::ifstream> readers(inputs.size());
  std::vector<std::uint64_t> counts(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    current = i;
    if (on_chunk_begin_) {
      on_chunk_begin_(*inputs[i]);
    }
    readers[i].open(inputs[i]->path, std::ios::binary);
    if (!readers[i]) {
      throw io_error("cannot open " + inputs[i]->path.string());
    }
    counts[i] = inputs[i]->records;
  }

  RemainingCounts remaining(counts);
  std::uint64_t written = 0;
  std::string line;
  while (remaining.total() > 0) {
    if (cancel_ && written % kCancelCheckInterval == 0) {
      cancel_->ThrowIfCancelled(Stage::kMerge);
    }
    std::uniform_int_distribution<std::uint64_t> draw(0, remaining.total() - 1);
    current = remaining.Find(draw(rng));
    if (!std::getline(readers[current], line)) {
      throw io_error("chunk ended early: " + inputs[current]->path.string());
    }
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.put('\n');
    if (!out) {
      throw io_error("write error on " + out_path.string());
    }
    remaining.Decrement(current);
    ++written;
    if (progress_ && final_pass) {
      progress_->AddMerged(line.size() + 1, 1);
    }
    if (remaining.at(current) == 0) {
      readers[current].close();
      AdvanceState(*inputs[current], ChunkState::kMerged);
      registry_.Release(inputs[current]->path);
    }
  }

  out.flush();
  out.close();
  if (out.fail()) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kMerge, "failed to flush " + out_path.string());
  }
  if (written != expected) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kMerge,
                       "wrote " + std::to_string(written) + " records, expected " + std::to_string(expected));
  }
  return written;
}

std::uint64_t MergeScheduler::Merge(std::vector<Chunk>& chunks, const std::filesystem::path& output_path,
                                    std::mt19937_64& rng) const {
  for (const auto& c : chunks) {
    if (c.state == ChunkState::kFailed) {
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kMerge,
                         "chunk failed earlier; refusing to drop its " + std::to_string(c.records) + " records",
                         c.index);
    }
    if (c.state != ChunkState::kShuffled) {
      throw ShuffleError(ErrorKind::kInternal, Stage::kMerge,
                         "chunk is " + std::string(ChunkStateName(c.state)) + ", expected shuffled", c.index);
    }
  }

  auto partial = output_path;
  partial += ".partial";
  registry_.Register(partial);

  // Intermediate chunks live beside the originals; deque keeps their addresses stable.
  std::deque<Chunk> intermediates;
  try {
    std::vector<Chunk*> level;
    level.reserve(chunks.size());
    for (auto& c : chunks) {
      level.push_back(&c);
    }

    const auto dir = chunks.empty() ? output_path.parent_path() : chunks.front().path.parent_path();
    std::size_t pass = 0;
    while (level.size() > max_fan_in_) {
      std::vector<Chunk*> next;
      for (std::size_t begin = 0; begin < level.size(); begin += max_fan_in_) {
        const std::size_t end = std::min(begin + max_fan_in_, level.size());
        if (end - begin == 1) {
          next.push_back(level[begin]);
          continue;
        }
        std::vector<Chunk*> group(level.begin() + static_cast<std::ptrdiff_t>(begin),
                                  level.begin() + static_cast<std::ptrdiff_t>(end));
        Chunk merged;
        merged.index = chunks.size() + intermediates.size();
        merged.path = dir / ("merge_" + std::to_string(pass) + "_" + std::to_string(next.size()) + ".txt");
        for (const Chunk* c : group) {
          merged.records += c->records;
          merged.bytes += c->bytes;
        }
        registry_.Register(merged.path);
        intermediates.push_back(merged);
        Interleave(group, merged.path, rng, false);
        AdvanceState(intermediates.back(), ChunkState::kWritten);
        AdvanceState(intermediates.back(), ChunkState::kShuffled);
        next.push_back(&intermediates.back());
      }
      level.swap(next);
      ++pass;
    }

    std::uint64_t written = Interleave(level, partial, rng, true);

    std::error_code ec;
    std::filesystem::rename(partial, output_path, ec);
    if (ec) {
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kMerge,
                         "cannot move output into place at " + output_path.string() + ": " + ec.message());
    }
    registry_.Forget(partial);
    return written;
  } catch (...) {
    for (const auto& c : intermediates) {
      registry_.Release(c.path);
    }
    registry_.Release(partial);
    throw;
  }
}

}  // namespace lineshuf
