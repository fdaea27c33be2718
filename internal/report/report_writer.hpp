#pragma once

#include <filesystem>
#include <string>

#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::report {

inline constexpr const char* kReportDir  = "06_report";
inline constexpr const char* kReportFile = "summary.md";

// Markdown summary of a run: input, stages, ensembles, clusters and ranking.
// Reads only the state and the artifacts it references.
std::string RenderSummary(const rnaflow::pipeline::v1::PipelineRun& run);

// Writes <run_dir>/06_report/summary.md and returns its path.
std::filesystem::path WriteSummary(const std::filesystem::path& run_dir, const rnaflow::pipeline::v1::PipelineRun& run);

// Re-renders the summary of an existing run without touching its state.
// Throws util::NotFound if the directory holds no pipeline state.
std::filesystem::path RegenerateReport(const std::filesystem::path& run_dir);

} // namespace rnaflow::report
