#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::scoring {

// Writes scores.json (protobuf JSON of the report) and ranking.tsv into `dir`.
// Returns the written paths.
std::vector<std::string> WriteScoringReport(const std::filesystem::path& dir, const rnaflow::pipeline::v1::ScoringReport& report);

} // namespace rnaflow::scoring
