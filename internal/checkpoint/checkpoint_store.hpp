#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/stage_graph.hpp"
#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::checkpoint {

using rnaflow::pipeline::v1::EnsembleResult;
using rnaflow::pipeline::v1::PipelineRun;
using rnaflow::pipeline::v1::StageRecord;

inline constexpr const char* kStateFileName = "pipeline_state.json";
inline constexpr int         kFormatVersion = 1;

/*
  Persists one PipelineRun as protobuf JSON inside its run directory.

  Every save goes through a temp file that is fsynced and renamed over the
  previous state, so a crash mid-write leaves the last good state in place.
  The Mark* helpers apply one stage transition and save before returning.
  Only the stage orchestrator thread calls into the store.
*/
class CheckpointStore {
 public:
  explicit CheckpointStore(std::filesystem::path run_directory);

  const std::filesystem::path& RunDirectory() const;
  std::filesystem::path        StatePath() const;

  // std::nullopt if the run directory has no state file. Stages found
  // `running` are downgraded to `pending`: no process survives a restart.
  std::optional<PipelineRun> Load() const;

  void Save(const PipelineRun& run) const;

  void MarkStageStarted(PipelineRun& run, const std::string& stage_id) const;
  // Throws util::InvalidState if any artifact is missing or empty; the run is left untouched.
  void MarkStageCompleted(PipelineRun& run, const std::string& stage_id, const std::vector<std::string>& artifacts,
                          const std::string& message = {}) const;
  void MarkStageFailed(PipelineRun& run, const std::string& stage_id, const std::string& reason) const;

  static std::string Serialize(const PipelineRun& run);
  // Unknown fields are ignored and missing ones defaulted.
  static PipelineRun Parse(const std::string& json);

 private:
  std::filesystem::path run_directory_;
};

StageRecord*       FindStageRecord(PipelineRun& run, const std::string& stage_id);
const StageRecord* FindStageRecord(const PipelineRun& run, const std::string& stage_id);

EnsembleResult*       FindEnsemble(PipelineRun& run, const std::string& backend);
const EnsembleResult* FindEnsemble(const PipelineRun& run, const std::string& backend);

// Replaces or inserts the ensemble for result.backend(), keeping the list sorted by backend.
void UpsertEnsemble(PipelineRun& run, EnsembleResult result);

// True if every artifact exists and is non-empty.
bool ArtifactsPresent(const StageRecord& record);

// Downgrades `running` stages to `pending`. Returns the number of stages reset.
int ResetInterruptedStages(PipelineRun& run);

/*
  Aligns the persisted stage records with the stage graph of the current
  invocation:
    - records for stages no longer in the graph are dropped,
    - missing stages are added as pending,
    - a completed stage with missing artifacts, or any stage whose fingerprint
      changed, is invalidated together with everything downstream of it,
    - a completed stage downstream of a stage that will run again is
      invalidated.
  Invalidating a stage discards the results it produced (ensemble, clusters
  or ranking). Returns the invalidated stage ids.
*/
std::vector<std::string> ReconcileWithGraph(PipelineRun& run, const std::vector<model::StageSpec>& graph);

} // namespace rnaflow::checkpoint
