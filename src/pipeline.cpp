#include "lineshuf/pipeline.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <new>
#include <random>
#include <system_error>
#include <utility>

#include "lineshuf/cancellation.hpp"
#include "lineshuf/chunk_shuffler.hpp"
#include "lineshuf/chunk_writer.hpp"
#include "lineshuf/errors.hpp"
#include "lineshuf/merge_scheduler.hpp"
#include "lineshuf/progress.hpp"
#include "lineshuf/record_reader.hpp"
#include "lineshuf/temp_registry.hpp"

namespace lineshuf {

namespace {

using Clock = std::chrono::steady_clock;

double SecondsSince(Clock::time_point t0) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(Clock::now() - t0).count();
}

std::uint64_t FreshSeed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

}  // namespace

ShufflePipeline::ShufflePipeline(ShuffleOptions options, ProgressMonitor& progress,
                                 const CancellationToken& cancel, PipelineHooks hooks)
    : options_(std::move(options)), progress_(progress), cancel_(cancel), hooks_(std::move(hooks)) {}

void ShufflePipeline::Log(const std::string& line) const {
  if (options_.verbose) {
    std::cerr << line << "\n";
  }
}

RunSummary ShufflePipeline::Run(const std::string& input_path) {
  const auto t0 = Clock::now();
  ValidateOptions(options_, input_path);

  RunSummary summary;
  summary.input_path = input_path;
  summary.output_path = options_.output_path;
  summary.seed = options_.seed ? *options_.seed : FreshSeed();

  TempFileRegistry registry(options_.verbose ? &std::cerr : nullptr);
  Stage stage = Stage::kSetup;
  try {
    const auto& run_dir = registry.CreateRunDirectory(options_.temp_dir);
    std::mt19937_64 rng(summary.seed);

    stage = Stage::kSplit;
    auto t_split = Clock::now();
    RecordReader reader(input_path);
    summary.input_bytes = reader.total_bytes();
    progress_.Start(reader.total_bytes());
    progress_.SetStage(ProgressStage::kSplitting);
    Log("[split] input " + input_path + " (" + std::to_string(reader.total_bytes()) + " bytes)");
    Log("[split] temp dir " + run_dir.string());

    ChunkWriter writer(ChunkWriterOptions{options_.chunk_records, options_.chunk_bytes}, run_dir, registry,
                       &progress_, &cancel_);
    if (hooks_.on_chunk_write) {
      writer.set_on_chunk_begin(hooks_.on_chunk_write);
    }
    auto chunks = writer.Split(reader);
    progress_.SetChunkCount(chunks.size());
    summary.chunks = chunks.size();
    for (const auto& c : chunks) {
      summary.records += c.records;
    }
    summary.split_seconds = SecondsSince(t_split);
    Log("[split] records " + std::to_string(summary.records) + " chunks " + std::to_string(chunks.size()));

    stage = Stage::kShuffle;
    auto t_shuffle = Clock::now();
    progress_.SetStage(ProgressStage::kShuffling);
    ChunkShufflerOptions sopts;
    sopts.max_chunk_memory_bytes = options_.max_memory_bytes;
    sopts.memory_limit_bytes = options_.max_memory_bytes;
    sopts.num_threads = options_.num_threads;
    ChunkShuffler shuffler(sopts, registry, &progress_, &cancel_);
    if (hooks_.on_chunk_shuffle) {
      shuffler.set_on_chunk_begin(hooks_.on_chunk_shuffle);
    }
    summary.shuffle_workers = shuffler.ConcurrencyFor(chunks);
    Log("[shuffle] workers " + std::to_string(summary.shuffle_workers));
    shuffler.ShuffleAll(chunks, rng);
    summary.shuffle_seconds = SecondsSince(t_shuffle);

    stage = Stage::kMerge;
    auto t_merge = Clock::now();
    progress_.SetStage(ProgressStage::kMerging);
    MergeScheduler merger(registry, &progress_, &cancel_);
    if (hooks_.on_chunk_merge) {
      merger.set_on_chunk_begin(hooks_.on_chunk_merge);
    }
    std::uint64_t merged = merger.Merge(chunks, options_.output_path, rng);
    summary.merge_seconds = SecondsSince(t_merge);
    summary.output_bytes = progress_.Snapshot().bytes_written;
    if (merged != summary.records) {
      std::error_code ec;
      std::filesystem::remove(options_.output_path, ec);
      throw ShuffleError(ErrorKind::kIoFailure, Stage::kMerge,
                         "merged " + std::to_string(merged) + " records, read " + std::to_string(summary.records));
    }
    stage = Stage::kCleanup;
    registry.CleanupAll();
    progress_.SetStage(ProgressStage::kDone);
  } catch (const ShuffleError& e) {
    progress_.SetStage(ProgressStage::kFailed);
    Log(std::string("[error] ") + e.what());
    registry.CleanupAll();
    throw;
  } catch (const std::bad_alloc&) {
    progress_.SetStage(ProgressStage::kFailed);
    registry.CleanupAll();
    ShuffleError err(ErrorKind::kMemoryExceeded, stage, "out of memory");
    Log(std::string("[error] ") + err.what());
    throw err;
  } catch (const std::filesystem::filesystem_error& e) {
    progress_.SetStage(ProgressStage::kFailed);
    registry.CleanupAll();
    ShuffleError err(ErrorKind::kIoFailure, stage, e.what());
    Log(std::string("[error] ") + err.what());
    throw err;
  }

  summary.total_seconds = SecondsSince(t0);
  Log("[done] records " + std::to_string(summary.records) + " output " + options_.output_path + " in " +
      FormatDuration(summary.total_seconds));
  return summary;
}

RunSummary ShuffleFile(const std::string& input_path, const ShuffleOptions& options, ProgressMonitor* progress,
                       const CancellationToken* cancel) {
  ProgressMonitor local_progress;
  CancellationToken local_cancel;
  ShufflePipeline pipeline(options, progress ? *progress : local_progress, cancel ? *cancel : local_cancel);
  return pipeline.Run(input_path);
}

}  // namespace lineshuf
