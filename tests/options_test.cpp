#include "test_util.hpp"

#include <limits>

#include "lineshuf/errors.hpp"
#include "lineshuf/options.hpp"

using namespace lineshuf;
using lineshuf::testing::ScratchDir;

namespace {

void TestParseArgs() {
  std::uint64_t u = 0;
  assert(ParseU64Arg("42", u) && u == 42);
  assert(!ParseU64Arg("", u));
  assert(!ParseU64Arg("-1", u));
  assert(!ParseU64Arg("12abc", u));
  assert(!ParseU64Arg(" 7", u));
  assert(!ParseU64Arg("99999999999999999999999", u));
  std::size_t s = 0;
  assert(ParseSizeArg("1000000", s) && s == 1000000);
}

void TestEnvFile() {
  ScratchDir dir;
  auto env_path = dir / ".env";
  {
    std::ofstream out(env_path, std::ios::binary);
    out << "\xEF\xBB\xBF# lineshuf settings\r\n"
        << "CHUNK_RECORDS = 500\n"
        << "TEMP_DIR=\"/var/tmp/shuf\"\n"
        << "SEED='17'\n"
        << "MAX_MEMORY_MB=2\n"
        << "not a pair\n"
        << "UNRELATED=1\n";
  }
  auto env = ReadEnvFile(env_path.string());
  assert(env.at("CHUNK_RECORDS") == "500");
  assert(env.at("TEMP_DIR") == "/var/tmp/shuf");
  assert(env.at("SEED") == "17");
  assert(env.count("not a pair") == 0);

  ShuffleOptions opts;
  ApplyEnvOverrides(opts, env);
  assert(opts.chunk_records == 500);
  assert(opts.chunk_bytes == 0);
  assert(opts.temp_dir == "/var/tmp/shuf");
  assert(opts.seed && *opts.seed == 17);
  assert(opts.max_memory_bytes == (std::size_t{2} << 20));

  assert(ReadEnvFile((dir / "missing.env").string()).empty());
}

void TestEnvRejectsGarbage() {
  ShuffleOptions opts;
  bool threw = false;
  try {
    ApplyEnvOverrides(opts, EnvMap{{"CHUNK_BYTES", "lots"}});
  } catch (const ShuffleError& e) {
    threw = e.kind() == ErrorKind::kConfigInvalid && e.stage() == Stage::kSetup;
  }
  assert(threw);
}

void TestMemoryLimitOutOfRange() {
  const std::size_t too_many_mb = (std::numeric_limits<std::size_t>::max() >> 20) + 1;
  assert(MegabytesToBytes(2) == (std::size_t{2} << 20));
  assert(MegabytesToBytes(too_many_mb - 1) == ((too_many_mb - 1) << 20));

  // --max-memory-mb goes through the same conversion.
  bool threw = false;
  try {
    (void)MegabytesToBytes(too_many_mb);
  } catch (const ShuffleError& e) {
    threw = e.kind() == ErrorKind::kConfigInvalid;
  }
  assert(threw);

  ShuffleOptions opts;
  threw = false;
  try {
    ApplyEnvOverrides(opts, EnvMap{{"MAX_MEMORY_MB", std::to_string(too_many_mb)}});
  } catch (const ShuffleError& e) {
    threw = e.kind() == ErrorKind::kConfigInvalid;
  }
  assert(threw);
  assert(opts.max_memory_bytes == 0);
}

void TestValidateFillsTempDir() {
  ScratchDir dir;
  ShuffleOptions opts;
  opts.output_path = (dir / "out.txt").string();
  ValidateOptions(opts, (dir / "in.txt").string());
  assert(!opts.temp_dir.empty());
  assert(std::filesystem::is_directory(opts.temp_dir));
}

void TestValidateRejects() {
  ScratchDir dir;
  auto expect_invalid = [&](ShuffleOptions opts, const std::string& input) {
    bool threw = false;
    try {
      ValidateOptions(opts, input);
    } catch (const ShuffleError& e) {
      threw = e.kind() == ErrorKind::kConfigInvalid;
    }
    assert(threw);
  };
  const auto in = (dir / "in.txt").string();

  ShuffleOptions no_output;
  expect_invalid(no_output, in);

  ShuffleOptions zero;
  zero.output_path = (dir / "out.txt").string();
  zero.chunk_records = 0;
  zero.chunk_bytes = 0;
  expect_invalid(zero, in);

  ShuffleOptions over_budget;
  over_budget.output_path = (dir / "out.txt").string();
  over_budget.chunk_bytes = 4096;
  over_budget.max_memory_bytes = 1024;
  expect_invalid(over_budget, in);

  ShuffleOptions same;
  same.output_path = (dir / "sub" / ".." / "in.txt").string();
  expect_invalid(same, in);
}

void TestExitCodes() {
  assert(ExitCodeFor(ErrorKind::kConfigInvalid) == 1);
  assert(ExitCodeFor(ErrorKind::kIoFailure) == 2);
  assert(ExitCodeFor(ErrorKind::kMemoryExceeded) == 3);
  assert(ExitCodeFor(ErrorKind::kInterruptRequested) == 130);

  ShuffleError e(ErrorKind::kIoFailure, Stage::kMerge, "disk full", 4);
  assert(std::string(e.what()) == "merge failed at chunk 4: disk full");
  ShuffleError no_chunk(ErrorKind::kConfigInvalid, Stage::kSetup, "bad");
  assert(std::string(no_chunk.what()) == "setup failed: bad");
}

}  // namespace

int main() {
  TestParseArgs();
  TestEnvFile();
  TestEnvRejectsGarbage();
  TestMemoryLimitOutOfRange();
  TestValidateFillsTempDir();
  TestValidateRejects();
  TestExitCodes();
  return 0;
}
