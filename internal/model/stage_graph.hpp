#pragma once

#include <string>
#include <vector>

#include "internal/model/run_settings.hpp"

namespace rnaflow::model {

enum class StageKind {
  kSequenceAnalysis,
  kSecondaryStructure,
  kPrediction,
  kClustering,
  kScoring,
  kReport,
};

inline constexpr const char* kSequenceAnalysisStage   = "sequence_analysis";
inline constexpr const char* kSecondaryStructureStage = "secondary_structure";
inline constexpr const char* kScoringStage            = "scoring";
inline constexpr const char* kReportStage             = "report";

std::string PredictionStageId(const std::string& backend);
std::string ClusteringStageId(const std::string& backend);

struct StageSpec {
  std::string id;
  StageKind   kind;
  std::string backend;
  // Hard dependencies: must be completed before the stage may start.
  std::vector<std::string> depends_on;
  // Soft dependencies: must be terminal (completed or failed).
  std::vector<std::string> follows;
  std::string              fingerprint;
};

/*
  Ordered stage list for one run:

      sequence_analysis → secondary_structure → prediction/<b>... →
      clustering/<b>... → scoring → report

  Backends are emitted in sorted order; clustering stages only when
  settings.cluster is set.
*/
std::vector<StageSpec> BuildStageGraph(const RunSettings& settings, const std::string& sequence);

// Every stage that transitively depends on or follows `stage_id`, in graph order.
std::vector<std::string> Downstream(const std::vector<StageSpec>& graph, const std::string& stage_id);

const StageSpec* FindStage(const std::vector<StageSpec>& graph, const std::string& stage_id);

// Digest over the settings that govern the whole run; stored with the PipelineRun.
std::string RunDigest(const RunSettings& settings, const std::string& sequence);

} // namespace rnaflow::model
