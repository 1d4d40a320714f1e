#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace lineshuf {

enum class ChunkState {
  kUnwritten,
  kWritten,
  kShuffled,
  kMerged,
  kFailed,
};

[[nodiscard]] std::string_view ChunkStateName(ChunkState state);

struct Chunk {
  std::size_t index = 0;
  std::filesystem::path path;
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;  // payload plus one '\n' per record
  ChunkState state = ChunkState::kUnwritten;
};

// Moves a chunk one step forward (or to kFailed). Throws ShuffleError(kInternal) for
// any other transition.
void AdvanceState(Chunk& chunk, ChunkState next);

}  // namespace lineshuf
