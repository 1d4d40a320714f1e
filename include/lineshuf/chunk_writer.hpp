#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <utility>
#include <vector>

#include "lineshuf/chunk.hpp"

namespace lineshuf {

class CancellationToken;
class ProgressMonitor;
class RecordReader;
class TempFileRegistry;

struct ChunkWriterOptions {
  std::size_t max_records = 0;  // 0 -> unbounded
  std::size_t max_bytes = 0;    // 0 -> unbounded
};

class ChunkWriter {
 public:
  using ChunkCallback = std::function<void(const Chunk&)>;

  ChunkWriter(ChunkWriterOptions options, std::filesystem::path directory,
              TempFileRegistry& registry, ProgressMonitor* progress = nullptr,
              const CancellationToken* cancel = nullptr);

  // Called after a chunk's file is registered and before its first record is written.
  void set_on_chunk_begin(ChunkCallback cb) { on_chunk_begin_ = std::move(cb); }

  [[nodiscard]] std::vector<Chunk> Split(RecordReader& reader);

  [[nodiscard]] static std::filesystem::path ChunkPath(const std::filesystem::path& directory,
                                                       std::size_t index);

 private:
  [[nodiscard]] bool ChunkFull(const Chunk& chunk) const;

  ChunkWriterOptions options_;
  std::filesystem::path directory_;
  TempFileRegistry& registry_;
  ProgressMonitor* progress_;
  const CancellationToken* cancel_;
  ChunkCallback on_chunk_begin_;
};

}  // namespace lineshuf
