#include "lineshuf/cancellation.hpp"

namespace lineshuf {

void CancellationToken::ThrowIfCancelled(Stage stage, std::optional<std::size_t> chunk) const {
  if (IsCancelled()) {
    throw ShuffleError(ErrorKind::kInterruptRequested, stage, "interrupted by operator", chunk);
  }
}

}  // namespace lineshuf
