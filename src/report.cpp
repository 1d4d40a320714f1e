#include "lineshuf/report.hpp"

#include <fstream>

#include "lineshuf/errors.hpp"

namespace lineshuf {

nlohmann::json RunSummaryToJson(const RunSummary& summary) {
  nlohmann::json j;
  j["input"] = summary.input_path;
  j["output"] = summary.output_path;
  j["seed"] = summary.seed;
  j["records"] = summary.records;
  j["input_bytes"] = summary.input_bytes;
  j["output_bytes"] = summary.output_bytes;
  j["chunks"] = summary.chunks;
  j["shuffle_workers"] = summary.shuffle_workers;
  j["seconds"] = {
      {"split", summary.split_seconds},
      {"shuffle", summary.shuffle_seconds},
      {"merge", summary.merge_seconds},
      {"total", summary.total_seconds},
  };
  return j;
}

void WriteRunReport(const RunSummary& summary, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kReport, "failed to create run report " + path);
  }
  out << RunSummaryToJson(summary).dump(2) << '\n';
  if (!out) {
    throw ShuffleError(ErrorKind::kIoFailure, Stage::kReport, "failed to write run report " + path);
  }
}

}  // namespace lineshuf
