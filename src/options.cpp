#include "lineshuf/options.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "lineshuf/errors.hpp"

namespace lineshuf {

namespace {

std::string Trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) {
    ++b;
  }
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
    --e;
  }
  return s.substr(b, e - b);
}

std::size_t EnvSize(const EnvMap& env, const std::string& key, std::size_t fallback) {
  auto it = env.find(key);
  if (it == env.end()) {
    return fallback;
  }
  std::size_t v = 0;
  if (!ParseSizeArg(it->second, v)) {
    throw ShuffleError(ErrorKind::kConfigInvalid, Stage::kSetup,
                       "invalid value for " + key + ": " + it->second);
  }
  return v;
}

}  // namespace

EnvMap ReadEnvFile(const std::string& path) {
  EnvMap env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void ApplyEnvOverrides(ShuffleOptions& options, const EnvMap& env) {
  options.chunk_records = EnvSize(env, "CHUNK_RECORDS", options.chunk_records);
  options.chunk_bytes = EnvSize(env, "CHUNK_BYTES", options.chunk_bytes);
  options.num_threads = EnvSize(env, "THREADS", options.num_threads);
  if (env.count("MAX_MEMORY_MB")) {
    options.max_memory_bytes = MegabytesToBytes(EnvSize(env, "MAX_MEMORY_MB", 0));
  }
  if (auto it = env.find("TEMP_DIR"); it != env.end()) {
    options.temp_dir = it->second;
  }
  if (auto it = env.find("REPORT_PATH"); it != env.end()) {
    options.report_path = it->second;
  }
  if (auto it = env.find("SEED"); it != env.end()) {
    std::uint64_t seed = 0;
    if (!ParseU64Arg(it->second, seed)) {
      throw ShuffleError(ErrorKind::kConfigInvalid, Stage::kSetup, "invalid value for SEED: " + it->second);
    }
    options.seed = seed;
  }
}

bool ParseU64Arg(const std::string& s, std::uint64_t& out) {
  if (s.empty() || s[0] < '0' || s[0] > '9') {
    return false;
  }
  try {
    std::size_t pos = 0;
    std::uint64_t v = static_cast<std::uint64_t>(std::stoull(s, &pos, 10));
    if (pos != s.size()) {
      return false;
    }
    out = v;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool ParseSizeArg(const std::string& s, std::size_t& out) {
  std::uint64_t v = 0;
  if (!ParseU64Arg(s, v)) {
    return false;
  }
  if (v > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return false;
  }
  out = static_cast<std::size_t>(v);
  return true;
}

std::size_t MegabytesToBytes(std::size_t megabytes) {
  if (megabytes > (std::numeric_limits<std::size_t>::max() >> 20)) {
    throw ShuffleError(ErrorKind::kConfigInvalid, Stage::kSetup,
                       "memory limit of " + std::to_string(megabytes) + " MiB is out of range");
  }
  return megabytes << 20;
}

void ValidateOptions(ShuffleOptions& options, const std::string& input_path) {
  auto invalid = [](const std::string& msg) {
    return ShuffleError(ErrorKind::kConfigInvalid, Stage::kSetup, msg);
  };
  if (options.chunk_records == 0 && options.chunk_bytes == 0) {
    throw invalid("chunk size must be positive (set chunk_records or chunk_bytes)");
  }
  if (options.max_memory_bytes > 0 && options.chunk_bytes > options.max_memory_bytes) {
    throw invalid("chunk_bytes " + std::to_string(options.chunk_bytes) + " exceeds memory limit " +
                  std::to_string(options.max_memory_bytes));
  }
  if (options.output_path.empty()) {
    throw invalid("output path is empty");
  }
  if (input_path.empty()) {
    throw invalid("input path is empty");
  }

  std::error_code ec;
  auto in_abs = std::filesystem::weakly_canonical(input_path, ec);
  std::error_code ec2;
  auto out_abs = std::filesystem::weakly_canonical(options.output_path, ec2);
  if (!ec && !ec2 && in_abs == out_abs) {
    throw invalid("output path must differ from input path: " + options.output_path);
  }

  if (options.temp_dir.empty()) {
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
      throw invalid("no system temp directory: " + ec.message());
    }
    options.temp_dir = tmp.string();
  }
  if (!std::filesystem::is_directory(options.temp_dir, ec)) {
    throw invalid("temp dir is not a directory: " + options.temp_dir);
  }
}

std::size_t EffectiveThreads(std::size_t configured) {
  if (configured > 0) {
    return configured;
  }
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4 : hw;
}

}  // namespace lineshuf
