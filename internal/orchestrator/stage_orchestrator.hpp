#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/clustering/clustering_engine.hpp"
#include "internal/model/run_settings.hpp"
#include "internal/model/stage_graph.hpp"
#include "internal/orchestrator/branch_queue.hpp"
#include "internal/predictor/predictor_dispatcher.hpp"
#include "internal/scoring/scorer.hpp"
#include "internal/upstream/upstream_tool.hpp"

namespace rnaflow::orchestrator {

// External collaborators of one run. Upstream tools may be null.
struct Toolchain {
  std::shared_ptr<upstream::UpstreamTool>                             sequence_analysis;
  std::shared_ptr<upstream::UpstreamTool>                             secondary_structure;
  std::map<std::string, std::shared_ptr<predictor::PredictorBackend>> backends;
  std::shared_ptr<scoring::Scorer>                                    scorer;
  // Empty means structures are read from disk.
  clustering::CoordinateLoader                                        coordinate_loader;
};

struct RunOptions {
  std::filesystem::path                       input_fasta;
  std::filesystem::path                       run_dir;
  model::RunSettings                          settings;
  std::map<std::string, predictor::BatchMode> batch_modes;
  std::set<std::string>                       lower_is_better;

  std::chrono::milliseconds tool_timeout{0};
  std::chrono::milliseconds prediction_timeout{0};
  std::chrono::milliseconds scoring_timeout{0};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(30)};

  const std::atomic<bool>* cancel = nullptr;
};

struct RunSummary {
  rnaflow::pipeline::v1::PipelineRun run;
  bool                               success     = false;
  bool                               interrupted = false;
  int                                structures  = 0;
  std::string                        failed_stage;
  std::string                        failure;
  std::filesystem::path              report_path;
};

/*
  Drives one pipeline run over the stage graph:

      sequence_analysis → secondary_structure → prediction/<b> (one thread
      per backend) → clustering/<b> → scoring → report

  Completed stages with a matching fingerprint are skipped. A stage whose
  hard dependencies did not complete is failed without running. Backend
  branches report through a BranchResultQueue; this thread alone applies
  transitions and persists them through the CheckpointStore.

  Configuration problems throw util::ConfigurationError before any stage
  starts; util::PersistenceError aborts the run. Every other failure is
  recorded on its stage and reflected in the returned summary.
*/
class StageOrchestrator {
 public:
  StageOrchestrator(Toolchain toolchain, RunOptions options);

  RunSummary Run();

 private:
  struct StageOutput {
    std::vector<std::string> artifacts;
    std::string              message;
  };

  using StageBody = std::function<StageOutput()>;

  void Prepare();
  void LoadOrCreateRun();

  void RunStage(const model::StageSpec& spec, const StageBody& body);
  void CheckDependencies(const model::StageSpec& spec) const;
  bool Completed(const std::string& stage_id) const;
  bool Cancelled() const;

  StageOutput RunUpstream(const std::shared_ptr<upstream::UpstreamTool>& tool, bool skip, const std::string& dir_name);
  void        RunPredictions();
  void        CompletePrediction(const model::StageSpec& spec, BranchResult result);
  StageOutput RunClustering(const std::string& backend);
  StageOutput RunScoring();
  StageOutput RunReport();

  predictor::PredictionInput BuildPredictionInput() const;
  std::vector<scoring::ScoringCandidate> CollectCandidates() const;
  RunSummary Summarize() const;

  Toolchain                          toolchain_;
  RunOptions                         options_;
  checkpoint::CheckpointStore        store_;
  std::vector<model::StageSpec>      graph_;
  rnaflow::pipeline::v1::PipelineRun run_;

  std::filesystem::path query_fasta_;
  std::string           sequence_id_;
  std::string           sequence_;
  bool                  interrupted_ = false;
};

} // namespace rnaflow::orchestrator
