#include "test_util.hpp"

#include <map>

#include "lineshuf/chunk_shuffler.hpp"
#include "lineshuf/chunk_writer.hpp"
#include "lineshuf/errors.hpp"
#include "lineshuf/merge_scheduler.hpp"
#include "lineshuf/progress.hpp"
#include "lineshuf/record_reader.hpp"
#include "lineshuf/temp_registry.hpp"

using namespace lineshuf;
using lineshuf::testing::ScratchDir;

namespace {

std::vector<Chunk> PrepareChunks(const std::filesystem::path& input, TempFileRegistry& registry,
                                 const std::filesystem::path& parent, std::size_t per_chunk,
                                 std::mt19937_64& rng) {
  auto run_dir = registry.CreateRunDirectory(parent);
  RecordReader reader(input.string());
  ChunkWriter writer(ChunkWriterOptions{per_chunk, 0}, run_dir, registry);
  auto chunks = writer.Split(reader);
  ChunkShuffler shuffler(ChunkShufflerOptions{0, 0, 1}, registry);
  shuffler.ShuffleAll(chunks, rng);
  return chunks;
}

void TestRemainingCountsLookup() {
  RemainingCounts counts(std::vector<std::uint64_t>{3, 0, 2, 5});
  assert(counts.total() == 10);
  std::vector<std::size_t> expected = {0, 0, 0, 2, 2, 3, 3, 3, 3, 3};
  for (std::uint64_t t = 0; t < 10; ++t) {
    assert(counts.Find(t) == expected[t]);
  }
  counts.Decrement(0);
  counts.Decrement(0);
  counts.Decrement(0);
  assert(counts.total() == 7);
  assert(counts.at(0) == 0);
  // Exhausted chunks are never selected again.
  for (std::uint64_t t = 0; t < counts.total(); ++t) {
    auto idx = counts.Find(t);
    assert(idx == 2 || idx == 3);
  }
  assert(counts.Find(0) == 2 && counts.Find(1) == 2 && counts.Find(2) == 3);

  RemainingCounts single(std::vector<std::uint64_t>{1});
  assert(single.Find(0) == 0);
}

void TestRemainingCountsOddSizes() {
  for (std::size_t n = 1; n <= 13; ++n) {
    std::vector<std::uint64_t> v(n);
    for (std::size_t i = 0; i < n; ++i) {
      v[i] = (i * 3) % 4;
    }
    RemainingCounts counts(v);
    std::uint64_t t = 0;
    for (std::size_t i = 0; i < n; ++i) {
      for (std::uint64_t k = 0; k < v[i]; ++k, ++t) {
        assert(counts.Find(t) == i);
      }
    }
    assert(t == counts.total());
  }
}

void TestMergeIsPermutation() {
  ScratchDir dir;
  auto lines = lineshuf::testing::NumberedLines(97);
  lineshuf::testing::WriteLines(dir / "in.txt", lines);
  TempFileRegistry registry;
  std::mt19937_64 rng(3);
  auto chunks = PrepareChunks(dir / "in.txt", registry, dir.path(), 10, rng);
  assert(chunks.size() == 10);

  ProgressMonitor progress;
  MergeScheduler merger(registry, &progress);
  auto written = merger.Merge(chunks, dir / "out.txt", rng);
  assert(written == 97);
  auto out = lineshuf::testing::ReadLines(dir / "out.txt");
  assert(lineshuf::testing::Sorted(out) == lineshuf::testing::Sorted(lines));
  assert(out != lines);
  for (const auto& c : chunks) {
    assert(c.state == ChunkState::kMerged);
    assert(!std::filesystem::exists(c.path));
  }
  assert(!std::filesystem::exists(dir / "out.txt.partial"));
  assert(registry.RegisteredPaths().empty());
  auto snap = progress.Snapshot();
  assert(snap.records_merged == 97);
  assert(snap.bytes_written == std::filesystem::file_size(dir / "out.txt"));
}

void TestInterleavingIsGloballyUniform() {
  // Two chunks of two records; all 24 global orders should appear evenly.
  // df=23 critical value at p=0.001 is 49.73.
  ScratchDir dir;
  lineshuf::testing::WriteLines(dir / "in.txt", {"1", "2", "3", "4"});
  std::map<std::vector<std::string>, std::size_t> freq;
  for (std::uint64_t seed = 0; seed < 2400; ++seed) {
    TempFileRegistry registry;
    std::mt19937_64 rng(seed * 2654435761ULL + 11);
    auto chunks = PrepareChunks(dir / "in.txt", registry, dir.path(), 2, rng);
    MergeScheduler merger(registry);
    merger.Merge(chunks, dir / "out.txt", rng);
    ++freq[lineshuf::testing::ReadLines(dir / "out.txt")];
  }
  assert(freq.size() == 24);
  std::vector<std::size_t> observed;
  for (const auto& [perm, count] : freq) {
    observed.push_back(count);
  }
  assert(lineshuf::testing::ChiSquare(observed) < 49.73);
}

void TestBoundedFanInMergesInPasses() {
  ScratchDir dir;
  auto lines = lineshuf::testing::NumberedLines(40);
  lineshuf::testing::WriteLines(dir / "in.txt", lines);
  TempFileRegistry registry;
  std::mt19937_64 rng(12);
  auto chunks = PrepareChunks(dir / "in.txt", registry, dir.path(), 2, rng);
  assert(chunks.size() == 20);

  ProgressMonitor progress;
  MergeScheduler merger(registry, &progress);
  merger.set_max_fan_in(3);
  std::size_t opened = 0;
  merger.set_on_chunk_begin([&](const Chunk&) { ++opened; });
  assert(merger.Merge(chunks, dir / "out.txt", rng) == 40);

  // Pass 0 turns 20 chunks into 7; pass 1 merges 6 of those into 2 and carries the
  // seventh over unopened; the final pass interleaves the remaining 3.
  assert(opened == 20 + 6 + 3);
  auto out = lineshuf::testing::ReadLines(dir / "out.txt");
  assert(lineshuf::testing::Sorted(out) == lineshuf::testing::Sorted(lines));
  for (const auto& c : chunks) {
    assert(c.state == ChunkState::kMerged);
  }
  assert(registry.RegisteredPaths().empty());
  assert(lineshuf::testing::CountEntries(registry.run_directory()) == 0);
  // Only the final pass counts toward progress.
  assert(progress.Snapshot().records_merged == 40);
}

void TestMultiPassInterleavingIsUniform() {
  // Four single-record chunks merged two at a time; df=23 critical value is 49.73.
  ScratchDir dir;
  lineshuf::testing::WriteLines(dir / "in.txt", {"1", "2", "3", "4"});
  std::map<std::vector<std::string>, std::size_t> freq;
  for (std::uint64_t seed = 0; seed < 2400; ++seed) {
    TempFileRegistry registry;
    std::mt19937_64 rng(seed * 40503ULL + 7);
    auto chunks = PrepareChunks(dir / "in.txt", registry, dir.path(), 1, rng);
    MergeScheduler merger(registry);
    merger.set_max_fan_in(2);
    merger.Merge(chunks, dir / "out.txt", rng);
    ++freq[lineshuf::testing::ReadLines(dir / "out.txt")];
  }
  assert(freq.size() == 24);
  std::vector<std::size_t> observed;
  for (const auto& [perm, count] : freq) {
    observed.push_back(count);
  }
  assert(lineshuf::testing::ChiSquare(observed) < 49.73);
}

void TestDefaultFanInIsBounded() {
  auto fan_in = MergeScheduler::DefaultFanIn();
  assert(fan_in >= 2 && fan_in <= 256);
  TempFileRegistry registry;
  MergeScheduler merger(registry);
  merger.set_max_fan_in(1);
  assert(merger.max_fan_in() == 2);
}

void TestFailedChunkAbortsMerge() {
  ScratchDir dir;
  lineshuf::testing::WriteLines(dir / "in.txt", lineshuf::testing::NumberedLines(6));
  TempFileRegistry registry;
  std::mt19937_64 rng(8);
  auto chunks = PrepareChunks(dir / "in.txt", registry, dir.path(), 2, rng);
  chunks[1].state = ChunkState::kFailed;

  MergeScheduler merger(registry);
  bool threw = false;
  try {
    merger.Merge(chunks, dir / "out.txt", rng);
  } catch (const ShuffleError& e) {
    threw = true;
    assert(e.kind() == ErrorKind::kIoFailure);
    assert(e.stage() == Stage::kMerge);
    assert(e.chunk() && *e.chunk() == 1);
  }
  assert(threw);
  assert(!std::filesystem::exists(dir / "out.txt"));
}

void TestTruncatedChunkLeavesNoOutput() {
  ScratchDir dir;
  lineshuf::testing::WriteLines(dir / "in.txt", lineshuf::testing::NumberedLines(6));
  TempFileRegistry registry;
  std::mt19937_64 rng(8);
  auto chunks = PrepareChunks(dir / "in.txt", registry, dir.path(), 3, rng);
  lineshuf::testing::WriteLines(chunks[0].path, {"only-one"});

  MergeScheduler merger(registry);
  bool threw = false;
  try {
    merger.Merge(chunks, dir / "out.txt", rng);
  } catch (const ShuffleError& e) {
    threw = e.kind() == ErrorKind::kIoFailure;
  }
  assert(threw);
  assert(!std::filesystem::exists(dir / "out.txt"));
  assert(!std::filesystem::exists(dir / "out.txt.partial"));
}

void TestEmptyMergeWritesEmptyOutput() {
  ScratchDir dir;
  TempFileRegistry registry;
  std::vector<Chunk> none;
  std::mt19937_64 rng(1);
  MergeScheduler merger(registry);
  assert(merger.Merge(none, dir / "out.txt", rng) == 0);
  assert(std::filesystem::exists(dir / "out.txt"));
  assert(std::filesystem::file_size(dir / "out.txt") == 0);
}

}  // namespace

int main() {
  TestRemainingCountsLookup();
  TestRemainingCountsOddSizes();
  TestMergeIsPermutation();
  TestInterleavingIsGloballyUniform();
  TestBoundedFanInMergesInPasses();
  TestMultiPassInterleavingIsUniform();
  TestDefaultFanInIsBounded();
  TestFailedChunkAbortsMerge();
  TestTruncatedChunkLeavesNoOutput();
  TestEmptyMergeWritesEmptyOutput();
  return 0;
}
