#include "lineshuf/chunk.hpp"

#include <string>

#include "lineshuf/errors.hpp"

namespace lineshuf {

std::string_view ChunkStateName(ChunkState state) {
  switch (state) {
    case ChunkState::kUnwritten:
      return "unwritten";
    case ChunkState::kWritten:
      return "written";
    case ChunkState::kShuffled:
      return "shuffled";
    case ChunkState::kMerged:
      return "merged";
    case ChunkState::kFailed:
      return "failed";
  }
  return "unknown";
}

void AdvanceState(Chunk& chunk, ChunkState next) {
  const ChunkState cur = chunk.state;
  bool ok = false;
  if (next == ChunkState::kFailed) {
    ok = cur != ChunkState::kMerged && cur != ChunkState::kFailed;
  } else if (cur != ChunkState::kFailed) {
    ok = static_cast<int>(next) == static_cast<int>(cur) + 1;
  }
  if (!ok) {
    throw ShuffleError(ErrorKind::kInternal, Stage::kSetup,
                       "illegal chunk transition " + std::string(ChunkStateName(cur)) + " -> " +
                           std::string(ChunkStateName(next)),
                       chunk.index);
  }
  chunk.state = next;
}

}  // namespace lineshuf
