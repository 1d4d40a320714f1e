#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "lineshuf/chunk.hpp"
#include "lineshuf/options.hpp"

namespace lineshuf {

class CancellationToken;
class ProgressMonitor;

struct PipelineHooks {
  std::function<void(const Chunk&)> on_chunk_write;
  std::function<void(const Chunk&)> on_chunk_shuffle;
  std::function<void(const Chunk&)> on_chunk_merge;
};

struct RunSummary {
  std::string input_path;
  std::string output_path;
  std::uint64_t seed = 0;
  std::uint64_t records = 0;
  std::uint64_t input_bytes = 0;
  std::uint64_t output_bytes = 0;
  std::size_t chunks = 0;
  std::size_t shuffle_workers = 0;
  double split_seconds = 0.0;
  double shuffle_seconds = 0.0;
  double merge_seconds = 0.0;
  double total_seconds = 0.0;
};

class ShufflePipeline {
 public:
  ShufflePipeline(ShuffleOptions options, ProgressMonitor& progress,
                  const CancellationToken& cancel, PipelineHooks hooks = {});

  // Shuffles input_path into options.output_path. Temp files are gone when this returns,
  // whether it returns normally or throws ShuffleError.
  RunSummary Run(const std::string& input_path);

  [[nodiscard]] const ShuffleOptions& options() const { return options_; }

 private:
  void Log(const std::string& line) const;

  ShuffleOptions options_;
  ProgressMonitor& progress_;
  const CancellationToken& cancel_;
  PipelineHooks hooks_;
};

// One-shot helper; progress and cancel may be null.
RunSummary ShuffleFile(const std::string& input_path, const ShuffleOptions& options,
                       ProgressMonitor* progress = nullptr,
                       const CancellationToken* cancel = nullptr);

}  // namespace lineshuf
