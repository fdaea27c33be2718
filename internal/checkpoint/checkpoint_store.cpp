#include "checkpoint_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rnaflow::checkpoint {

using namespace rnaflow::pipeline::v1;
using rnaflow::observability::IntField;
using rnaflow::observability::StringField;
using rnaflow::util::InvalidState;
using rnaflow::util::PersistenceError;

namespace {

void WriteAll(int fd, const std::string& data, const std::string& path) {
  const char* cursor    = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw PersistenceError("write failed for " + path + ": " + std::strerror(errno));
    }
    cursor += written;
    remaining -= static_cast<std::size_t>(written);
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    throw PersistenceError("cannot open run directory for sync: " + dir.string());
  }
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw PersistenceError("fsync failed for " + dir.string() + ": " + std::strerror(errno));
  }
}

StageRecord& RequireStage(PipelineRun& run, const std::string& stage_id) {
  auto* record = FindStageRecord(run, stage_id);
  if (!record) {
    throw InvalidState("unknown stage: " + stage_id);
  }
  return *record;
}

void Transition(StageRecord& record, StageStatus to) {
  if (!model::CanTransition(record.status(), to)) {
    throw InvalidState("stage " + record.stage_id() + ": illegal transition " + model::StatusName(record.status()) + " -> " +
                       model::StatusName(to));
  }
  record.set_status(to);
  *record.mutable_updated_at() = util::ToProto(util::Now());
}

bool ArtifactPresent(const std::string& artifact) {
  std::error_code ec;
  const std::filesystem::path path(artifact);
  if (std::filesystem::is_directory(path, ec)) {
    return !std::filesystem::is_empty(path, ec) && !ec;
  }
  auto size = std::filesystem::file_size(path, ec);
  return !ec && size > 0;
}

void DiscardResults(PipelineRun& run, const model::StageSpec& spec) {
  switch (spec.kind) {
    case model::StageKind::kPrediction: {
      auto* ensembles = run.mutable_ensembles();
      ensembles->erase(std::remove_if(ensembles->begin(), ensembles->end(),
                                      [&](const EnsembleResult& ensemble) { return ensemble.backend() == spec.backend; }),
                       ensembles->end());
      break;
    }
    case model::StageKind::kClustering:
      if (auto* ensemble = FindEnsemble(run, spec.backend)) {
        ensemble->clear_clusters();
        ensemble->set_unclustered_fallback(false);
      }
      break;
    case model::StageKind::kScoring:
      run.clear_ranking();
      break;
    default:
      break;
  }
}

void Invalidate(PipelineRun& run, const model::StageSpec& spec, const std::string& reason) {
  auto* record = FindStageRecord(run, spec.id);
  if (!record) {
    return;
  }
  record->set_status(STAGE_STATUS_PENDING);
  record->clear_artifacts();
  record->set_message("invalidated: " + reason);
  record->set_fingerprint(spec.fingerprint);
  *record->mutable_updated_at() = util::ToProto(util::Now());
  DiscardResults(run, spec);
}

} // namespace

CheckpointStore::CheckpointStore(std::filesystem::path run_directory) : run_directory_(std::move(run_directory)) {
}

const std::filesystem::path& CheckpointStore::RunDirectory() const {
  return run_directory_;
}

std::filesystem::path CheckpointStore::StatePath() const {
  return run_directory_ / kStateFileName;
}

std::optional<PipelineRun> CheckpointStore::Load() const {
  const auto path = StatePath();
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw PersistenceError("cannot read checkpoint: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto run   = Parse(buffer.str());
  auto reset = ResetInterruptedStages(run);
  if (reset > 0) {
    RNAFLOW_LOG_WARN("Found interrupted stages; they will be re-run", {IntField("count", reset)});
  }
  return run;
}

void CheckpointStore::Save(const PipelineRun& run) const {
  const auto json     = Serialize(run);
  const auto path     = StatePath();
  const auto tmp_path = path.string() + ".tmp";

  std::error_code ec;
  std::filesystem::create_directories(run_directory_, ec);
  if (ec) {
    throw PersistenceError("cannot create run directory " + run_directory_.string() + ": " + ec.message());
  }

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw PersistenceError("cannot open " + tmp_path + ": " + std::strerror(errno));
  }
  try {
    WriteAll(fd, json, tmp_path);
    if (::fsync(fd) != 0) {
      throw PersistenceError("fsync failed for " + tmp_path + ": " + std::strerror(errno));
    }
  } catch (...) {
    ::close(fd);
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
  if (::close(fd) != 0) {
    std::filesystem::remove(tmp_path, ec);
    throw PersistenceError("close failed for " + tmp_path + ": " + std::strerror(errno));
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw PersistenceError("cannot replace " + path.string() + ": " + ec.message());
  }
  SyncDirectory(run_directory_);
}

void CheckpointStore::MarkStageStarted(PipelineRun& run, const std::string& stage_id) const {
  auto& record = RequireStage(run, stage_id);
  Transition(record, STAGE_STATUS_RUNNING);
  record.clear_artifacts();
  record.clear_message();
  Save(run);
  RNAFLOW_LOG_INFO("Stage started", {StringField("stage", stage_id)});
}

void CheckpointStore::MarkStageCompleted(PipelineRun& run, const std::string& stage_id, const std::vector<std::string>& artifacts,
                                         const std::string& message) const {
  auto& record = RequireStage(run, stage_id);
  for (const auto& artifact : artifacts) {
    if (!ArtifactPresent(artifact)) {
      throw InvalidState("stage " + stage_id + ": artifact missing or empty: " + artifact);
    }
  }

  Transition(record, STAGE_STATUS_COMPLETED);
  record.clear_artifacts();
  for (const auto& artifact : artifacts) {
    record.add_artifacts(artifact);
  }
  record.set_message(message);
  Save(run);
  RNAFLOW_LOG_INFO("Stage completed", {StringField("stage", stage_id), IntField("artifacts", static_cast<std::int64_t>(artifacts.size()))});
}

void CheckpointStore::MarkStageFailed(PipelineRun& run, const std::string& stage_id, const std::string& reason) const {
  auto& record = RequireStage(run, stage_id);
  Transition(record, STAGE_STATUS_FAILED);
  record.clear_artifacts();
  record.set_message(reason);
  Save(run);
  RNAFLOW_LOG_ERROR("Stage failed", {StringField("stage", stage_id), StringField("reason", reason)});
}

std::string CheckpointStore::Serialize(const PipelineRun& run) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(run, &json, options);
  if (!status.ok()) {
    throw PersistenceError("cannot serialize pipeline state: " + std::string(status.message()));
  }
  if (json.empty() || json.back() != '\n') {
    json.push_back('\n');
  }
  return json;
}

PipelineRun CheckpointStore::Parse(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  PipelineRun run;
  auto        status = google::protobuf::util::JsonStringToMessage(json, &run, options);
  if (!status.ok()) {
    throw PersistenceError("corrupt pipeline state: " + std::string(status.message()));
  }
  return run;
}

StageRecord* FindStageRecord(PipelineRun& run, const std::string& stage_id) {
  for (auto& record : *run.mutable_stages()) {
    if (record.stage_id() == stage_id) {
      return &record;
    }
  }
  return nullptr;
}

const StageRecord* FindStageRecord(const PipelineRun& run, const std::string& stage_id) {
  for (const auto& record : run.stages()) {
    if (record.stage_id() == stage_id) {
      return &record;
    }
  }
  return nullptr;
}

EnsembleResult* FindEnsemble(PipelineRun& run, const std::string& backend) {
  for (auto& ensemble : *run.mutable_ensembles()) {
    if (ensemble.backend() == backend) {
      return &ensemble;
    }
  }
  return nullptr;
}

const EnsembleResult* FindEnsemble(const PipelineRun& run, const std::string& backend) {
  for (const auto& ensemble : run.ensembles()) {
    if (ensemble.backend() == backend) {
      return &ensemble;
    }
  }
  return nullptr;
}

void UpsertEnsemble(PipelineRun& run, EnsembleResult result) {
  if (auto* existing = FindEnsemble(run, result.backend())) {
    *existing = std::move(result);
    return;
  }
  *run.add_ensembles() = std::move(result);
  std::sort(run.mutable_ensembles()->begin(), run.mutable_ensembles()->end(),
            [](const EnsembleResult& a, const EnsembleResult& b) { return a.backend() < b.backend(); });
}

bool ArtifactsPresent(const StageRecord& record) {
  return std::all_of(record.artifacts().begin(), record.artifacts().end(), [](const std::string& a) { return ArtifactPresent(a); });
}

int ResetInterruptedStages(PipelineRun& run) {
  int reset = 0;
  for (auto& record : *run.mutable_stages()) {
    if (record.status() == STAGE_STATUS_RUNNING) {
      record.set_status(STAGE_STATUS_PENDING);
      record.clear_artifacts();
      record.set_message("interrupted");
      ++reset;
    }
  }
  return reset;
}

std::vector<std::string> ReconcileWithGraph(PipelineRun& run, const std::vector<model::StageSpec>& graph) {
  std::set<std::string> backends;
  for (const auto& spec : graph) {
    if (spec.kind == model::StageKind::kPrediction) {
      backends.insert(spec.backend);
    }
  }

  // Rebuild the record list in graph order, carrying over what was persisted.
  google::protobuf::RepeatedPtrField<StageRecord> ordered;
  for (const auto& spec : graph) {
    StageRecord record;
    if (const auto* existing = FindStageRecord(run, spec.id)) {
      record = *existing;
    } else {
      record.set_stage_id(spec.id);
      record.set_status(STAGE_STATUS_PENDING);
      record.set_fingerprint(spec.fingerprint);
    }
    record.clear_depends_on();
    record.clear_follows();
    for (const auto& id : spec.depends_on) {
      record.add_depends_on(id);
    }
    for (const auto& id : spec.follows) {
      record.add_follows(id);
    }
    *ordered.Add() = std::move(record);
  }
  run.mutable_stages()->Swap(&ordered);

  auto* ensembles = run.mutable_ensembles();
  ensembles->erase(std::remove_if(ensembles->begin(), ensembles->end(),
                                  [&](const EnsembleResult& ensemble) { return backends.count(ensemble.backend()) == 0; }),
                   ensembles->end());

  std::vector<std::string> invalidated;
  std::set<std::string>    seen;
  for (const auto& spec : graph) {
    if (seen.count(spec.id) > 0) {
      continue;
    }
    const auto* record = FindStageRecord(run, spec.id);

    std::string reason;
    if (record->fingerprint() != spec.fingerprint) {
      reason = "configuration changed";
    } else if (record->status() == STAGE_STATUS_COMPLETED && !ArtifactsPresent(*record)) {
      reason = "artifacts missing";
    }
    if (reason.empty()) {
      continue;
    }

    RNAFLOW_LOG_INFO("Invalidating stage", {StringField("stage", spec.id), StringField("reason", reason)});
    Invalidate(run, spec, reason);
    seen.insert(spec.id);
    invalidated.push_back(spec.id);

    for (const auto& downstream_id : model::Downstream(graph, spec.id)) {
      if (seen.insert(downstream_id).second) {
        Invalidate(run, *model::FindStage(graph, downstream_id), "upstream " + spec.id + " invalidated");
        invalidated.push_back(downstream_id);
      }
    }
  }

  // A stage that did not complete runs again, so results built on its
  // previous outcome are stale.
  for (const auto& spec : graph) {
    if (FindStageRecord(run, spec.id)->status() == STAGE_STATUS_COMPLETED) {
      continue;
    }
    for (const auto& downstream_id : model::Downstream(graph, spec.id)) {
      const auto* record = FindStageRecord(run, downstream_id);
      if (record->status() != STAGE_STATUS_COMPLETED || !seen.insert(downstream_id).second) {
        continue;
      }
      RNAFLOW_LOG_INFO("Invalidating stage", {StringField("stage", downstream_id), StringField("reason", "upstream " + spec.id + " will re-run")});
      Invalidate(run, *model::FindStage(graph, downstream_id), "upstream " + spec.id + " will re-run");
      invalidated.push_back(downstream_id);
    }
  }
  return invalidated;
}

} // namespace rnaflow::checkpoint
