#include "lineshuf/chunk_writer.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <utility>

#include "lineshuf/cancellation.hpp"
#include "lineshuf/errors.hpp"
#include "lineshuf/progress.hpp"
#include "lineshuf/record_reader.hpp"
#include "lineshuf/temp_registry.hpp"

namespace lineshuf {

ChunkWriter::ChunkWriter(ChunkWriterOptions options, std::filesystem::path directory,
                         TempFileRegistry& registry, ProgressMonitor* progress,
                         const CancellationToken* cancel)
    : options_(options),
      directory_(std::move(directory)),
      registry_(registry),
      progress_(progress),
      cancel_(cancel) {
  if (options_.max_records == 0 && options_.max_bytes == 0) {
    throw ShuffleError(ErrorKind::kConfigInvalid, Stage::kSplit, "chunk size must be positive");
  }
}

std::filesystem::path ChunkWriter::ChunkPath(const std::filesystem::path& directory, std::size_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "chunk_%06zu.txt", index);
  return directory / name;
}

bool ChunkWriter::ChunkFull(const Chunk& chunk) const {
  if (options_.max_records > 0 && chunk.records >= options_.max_records) {
    return true;
  }
  return options_.max_bytes > 0 && chunk.bytes >= options_.max_bytes;
}

std::vector<Chunk> ChunkWriter::Split(RecordReader& reader) {
  std::vector<Chunk> chunks;
  std::ofstream out;
  Chunk cur;
  bool open = false;
  std::uint64_t last_consumed = reader.bytes_consumed();

  auto fail = [&](const std::string& what) {
    if (open) {
      AdvanceState(cur, ChunkState::kFailed);
    }
    return ShuffleError(ErrorKind::kIoFailure, Stage::kSplit, what, cur.index);
  };

  auto close_chunk = [&]() {
    out.flush();
    out.close();
    if (out.fail()) {
      throw fail("failed to flush " + cur.path.string());
    }
    AdvanceState(cur, ChunkState::kWritten);
    if (progress_) {
      progress_->AddChunkWritten();
    }
    chunks.push_back(cur);
    open = false;
  };

  std::string record;
  while (true) {
    if (cancel_) {
      cancel_->ThrowIfCancelled(Stage::kSplit, open ? std::optional<std::size_t>(cur.index) : std::nullopt);
    }
    if (!reader.Next(record)) {
      break;
    }
    if (!open) {
      cur = Chunk{};
      cur.index = chunks.size();
      cur.path = ChunkPath(directory_, cur.index);
      registry_.Register(cur.path);
      open = true;
      if (on_chunk_begin_) {
        on_chunk_begin_(cur);
      }
      out.open(cur.path, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw fail("cannot create chunk file " + cur.path.string());
      }
    }

    out.write(record.data(), static_cast<std::streamsize>(record.size()));
    out.put('\n');
    if (!out) {
      throw fail("write error on " + cur.path.string());
    }
    cur.records += 1;
    cur.bytes += record.size() + 1;

    if (progress_) {
      std::uint64_t consumed = reader.bytes_consumed();
      progress_->AddRead(consumed - last_consumed, 1);
      last_consumed = consumed;
    }
    if (ChunkFull(cur)) {
      close_chunk();
    }
  }
  if (open) {
    close_chunk();
  }
  return chunks;
}

}  // namespace lineshuf
