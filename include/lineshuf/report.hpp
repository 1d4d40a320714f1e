#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "lineshuf/pipeline.hpp"

namespace lineshuf {

[[nodiscard]] nlohmann::json RunSummaryToJson(const RunSummary& summary);

void WriteRunReport(const RunSummary& summary, const std::string& path);

}  // namespace lineshuf
