#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace lineshuf {

struct ShuffleOptions {
  std::size_t chunk_records = 1'000'000;  // 0 -> no record limit
  std::size_t chunk_bytes = 0;            // 0 -> no byte limit
  std::string output_path;
  std::string temp_dir;                   // empty -> system temp directory
  std::optional<std::uint64_t> seed;      // unset -> random_device
  std::size_t num_threads = 0;            // 0 -> hardware concurrency
  std::size_t max_memory_bytes = 0;       // 0 -> unlimited
  std::string report_path;
  bool verbose = true;
};

using EnvMap = std::unordered_map<std::string, std::string>;

// KEY=VALUE lines; '#' comments, optional quotes and a UTF-8 BOM are accepted.
// A missing file yields an empty map.
[[nodiscard]] EnvMap ReadEnvFile(const std::string& path);

// Throws ShuffleError(kConfigInvalid) for values that do not parse.
void ApplyEnvOverrides(ShuffleOptions& options, const EnvMap& env);

[[nodiscard]] bool ParseU64Arg(const std::string& s, std::uint64_t& out);
[[nodiscard]] bool ParseSizeArg(const std::string& s, std::size_t& out);

// MiB to bytes. Throws ShuffleError(kConfigInvalid) when the result does not fit in size_t.
[[nodiscard]] std::size_t MegabytesToBytes(std::size_t megabytes);

// Checks the options against the input path and fills in defaults that depend on the
// machine (temp directory). Throws ShuffleError(kConfigInvalid).
void ValidateOptions(ShuffleOptions& options, const std::string& input_path);

[[nodiscard]] std::size_t EffectiveThreads(std::size_t configured);

}  // namespace lineshuf
