#include "stage_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iomanip>
#include <thread>

#include "internal/ensemble/diversity_controller.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_writer.hpp"
#include "internal/scoring/consensus_rank.hpp"
#include "internal/scoring/scoring_report.hpp"
#include "internal/upstream/infernal_tool.hpp"
#include "internal/upstream/rnafold_tool.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/fasta.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace rnaflow::orchestrator {

using namespace rnaflow::pipeline::v1;
using rnaflow::observability::IntField;
using rnaflow::observability::StringField;

namespace {

constexpr const char* kInputDir      = "input";
constexpr const char* kQueryFile     = "query.fasta";
constexpr const char* kSequenceDir   = "01_sequence_analysis";
constexpr const char* kSecondaryDir  = "02_secondary_structure";
constexpr const char* kPredictionDir = "03_prediction";
constexpr const char* kClusteringDir = "04_clustering";
constexpr const char* kScoringDir    = "05_scoring";
constexpr const char* kLogDir        = "logs";

std::string StructureId(const EnsembleMember& member) {
  return member.backend() + "_seed" + std::to_string(member.seed_index());
}

scoring::ScoringCandidate ToCandidate(const EnsembleMember& member) {
  return scoring::ScoringCandidate{StructureId(member), member.backend(), member.seed_index(), member.structure_path()};
}

int CountSucceeded(const EnsembleResult& ensemble) {
  return static_cast<int>(std::count_if(ensemble.members().begin(), ensemble.members().end(),
                                        [](const EnsembleMember& member) { return !member.failed(); }));
}

std::filesystem::path WriteClusterTable(const std::filesystem::path& dir, const EnsembleResult& ensemble) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);

  const auto    path = dir / "clusters.tsv";
  std::ofstream out(path, std::ios::trunc);
  out << "cluster_id\tpopulation\trepresentative_seed\tmean_rmsd\tmax_rmsd\tmember_seeds\trepresentative_path\n";
  for (const auto& cluster : ensemble.clusters()) {
    const auto& representative = ensemble.members(cluster.representative());
    out << cluster.cluster_id() << "\t" << cluster.member_indices_size() << "\t" << representative.seed_index() << "\t" << std::fixed
        << std::setprecision(3) << cluster.stats().mean_rmsd() << "\t" << cluster.stats().max_rmsd() << "\t";
    for (int i = 0; i < cluster.member_indices_size(); ++i) {
      out << (i > 0 ? "," : "") << ensemble.members(cluster.member_indices(i)).seed_index();
    }
    out << "\t" << representative.structure_path() << "\n";
  }
  if (!out.good()) {
    throw util::InvalidState("cannot write " + path.string());
  }
  return path;
}

} // namespace

StageOrchestrator::StageOrchestrator(Toolchain toolchain, RunOptions options)
    : toolchain_(std::move(toolchain)), options_(std::move(options)), store_(options_.run_dir) {
}

bool StageOrchestrator::Cancelled() const {
  return options_.cancel && options_.cancel->load();
}

bool StageOrchestrator::Completed(const std::string& stage_id) const {
  const auto* record = checkpoint::FindStageRecord(run_, stage_id);
  return record && record->status() == STAGE_STATUS_COMPLETED;
}

void StageOrchestrator::Prepare() {
  auto& settings = options_.settings;

  std::sort(settings.backends.begin(), settings.backends.end());
  settings.backends.erase(std::unique(settings.backends.begin(), settings.backends.end()), settings.backends.end());
  if (settings.backends.empty()) {
    throw util::ConfigurationError("no prediction backend selected");
  }
  for (const auto& name : settings.backends) {
    auto it = toolchain_.backends.find(name);
    if (it == toolchain_.backends.end() || !it->second) {
      throw util::ConfigurationError("unknown backend '" + name + "'");
    }
    auto mode = options_.batch_modes.count(name) ? options_.batch_modes.at(name) : predictor::BatchMode::kAuto;
    predictor::PredictorDispatcher::UseBatch(*it->second, mode);
    settings.backend_descriptors[name] = it->second->Descriptor();
  }

  ensemble::Plan(settings.nstruct, settings.mc_dropout, settings.noise_scale);
  if (settings.rmsd_threshold <= 0.0) {
    throw util::ConfigurationError("rmsd_threshold must be positive");
  }
  if (settings.cluster && settings.atom_names.empty()) {
    throw util::ConfigurationError("atom_names must not be empty");
  }
  if (!toolchain_.scorer && !settings.skip_scoring) {
    throw util::ConfigurationError("no scorer configured");
  }
  if (toolchain_.scorer) {
    settings.scorer_descriptor = toolchain_.scorer->Descriptor();
  }

  std::vector<util::FastaRecord> records;
  try {
    records = util::ReadFasta(options_.input_fasta);
  } catch (const util::NotFound& e) {
    throw util::ConfigurationError(e.what());
  }
  if (records.empty() || records.front().sequence.empty()) {
    throw util::ConfigurationError("no sequence in " + options_.input_fasta.string());
  }
  if (records.size() > 1) {
    RNAFLOW_LOG_WARN("Input has several records; only the first is used", {IntField("records", static_cast<std::int64_t>(records.size()))});
  }
  sequence_id_ = records.front().Id();
  sequence_    = records.front().sequence;

  std::error_code ec;
  const auto      input_dir = options_.run_dir / kInputDir;
  std::filesystem::create_directories(input_dir, ec);
  if (ec) {
    throw util::PersistenceError("cannot create " + input_dir.string() + ": " + ec.message());
  }
  query_fasta_ = std::filesystem::absolute(input_dir / kQueryFile);
  if (!std::filesystem::equivalent(options_.input_fasta, query_fasta_, ec)) {
    std::filesystem::copy_file(options_.input_fasta, query_fasta_, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      throw util::PersistenceError("cannot copy input to " + query_fasta_.string() + ": " + ec.message());
    }
  }

  graph_ = model::BuildStageGraph(settings, sequence_);
}

void StageOrchestrator::LoadOrCreateRun() {
  const auto& settings = options_.settings;

  if (auto existing = store_.Load()) {
    run_ = std::move(*existing);
    RNAFLOW_LOG_INFO("Resuming run", {StringField("run_id", run_.run_id()), StringField("dir", options_.run_dir.string())});
    if (run_.format_version() > checkpoint::kFormatVersion) {
      RNAFLOW_LOG_WARN("State was written by a newer version", {IntField("format_version", run_.format_version())});
    }
  } else {
    run_.set_format_version(checkpoint::kFormatVersion);
    run_.set_run_id(util::NewRunId());
    *run_.mutable_created_at() = util::ToProto(util::Now());
    RNAFLOW_LOG_INFO("Starting new run", {StringField("run_id", run_.run_id()), StringField("dir", options_.run_dir.string())});
  }

  run_.set_input_path(query_fasta_.string());
  run_.set_sequence_id(sequence_id_);
  run_.set_sequence_length(static_cast<int>(sequence_.size()));

  auto* fingerprint = run_.mutable_fingerprint();
  fingerprint->Clear();
  for (const auto& backend : settings.backends) {
    fingerprint->add_backends(backend);
  }
  fingerprint->set_nstruct(settings.nstruct);
  fingerprint->set_mc_dropout(settings.mc_dropout);
  fingerprint->set_noise_scale(settings.noise_scale);
  for (const auto& device : settings.devices) {
    fingerprint->add_devices(device);
  }
  fingerprint->set_rmsd_threshold(settings.rmsd_threshold);
  fingerprint->set_digest(model::RunDigest(settings, sequence_));

  auto invalidated = checkpoint::ReconcileWithGraph(run_, graph_);
  if (!invalidated.empty()) {
    RNAFLOW_LOG_INFO("Stages will be re-run", {IntField("invalidated", static_cast<std::int64_t>(invalidated.size()))});
  }
  store_.Save(run_);
}

RunSummary StageOrchestrator::Run() {
  Prepare();
  LoadOrCreateRun();

  bool predictions_done = false;
  for (const auto& spec : graph_) {
    if (Cancelled()) {
      interrupted_ = true;
      break;
    }
    switch (spec.kind) {
      case model::StageKind::kSequenceAnalysis:
        RunStage(spec, [this] {
          return RunUpstream(toolchain_.sequence_analysis, options_.settings.skip_sequence_analysis, kSequenceDir);
        });
        break;
      case model::StageKind::kSecondaryStructure:
        RunStage(spec, [this] { return RunUpstream(toolchain_.secondary_structure, false, kSecondaryDir); });
        break;
      case model::StageKind::kPrediction:
        if (!predictions_done) {
          RunPredictions();
          predictions_done = true;
        }
        break;
      case model::StageKind::kClustering:
        RunStage(spec, [this, backend = spec.backend] { return RunClustering(backend); });
        break;
      case model::StageKind::kScoring:
        RunStage(spec, [this] { return RunScoring(); });
        break;
      case model::StageKind::kReport:
        RunStage(spec, [this] { return RunReport(); });
        break;
    }
  }
  if (Cancelled()) {
    interrupted_ = true;
  }
  return Summarize();
}

void StageOrchestrator::CheckDependencies(const model::StageSpec& spec) const {
  for (const auto& id : spec.depends_on) {
    if (!Completed(id)) {
      throw util::UpstreamStageFailure("upstream stage " + id + " did not complete");
    }
  }
  for (const auto& id : spec.follows) {
    const auto* record = checkpoint::FindStageRecord(run_, id);
    if (!record || !model::IsTerminal(record->status())) {
      throw util::UpstreamStageFailure("upstream stage " + id + " has not finished");
    }
  }
}

void StageOrchestrator::RunStage(const model::StageSpec& spec, const StageBody& body) {
  if (Completed(spec.id)) {
    RNAFLOW_LOG_INFO("Skipping completed stage", {StringField("stage", spec.id)});
    return;
  }
  try {
    CheckDependencies(spec);
  } catch (const util::UpstreamStageFailure& e) {
    store_.MarkStageFailed(run_, spec.id, e.what());
    return;
  }

  store_.MarkStageStarted(run_, spec.id);
  try {
    auto output = body();
    if (Cancelled()) {
      throw util::Interrupted("interrupted");
    }
    store_.MarkStageCompleted(run_, spec.id, output.artifacts, output.message);
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    if (Cancelled()) {
      interrupted_ = true;
      store_.MarkStageFailed(run_, spec.id, "interrupted");
    } else {
      store_.MarkStageFailed(run_, spec.id, e.what());
    }
  }
}

StageOrchestrator::StageOutput StageOrchestrator::RunUpstream(const std::shared_ptr<upstream::UpstreamTool>& tool, bool skip,
                                                              const std::string& dir_name) {
  if (skip) {
    return {{}, "skipped"};
  }
  if (!tool) {
    return {{}, "skipped: not configured"};
  }
  if (!tool->IsAvailable()) {
    RNAFLOW_LOG_WARN("Upstream tool not available; stage skipped", {StringField("tool", tool->Name())});
    return {{}, "skipped: " + tool->Name() + " not available"};
  }

  upstream::UpstreamContext context;
  context.work_dir   = options_.run_dir / dir_name;
  context.log_dir    = options_.run_dir / kLogDir / dir_name;
  context.timeout    = options_.tool_timeout;
  context.kill_grace = options_.kill_grace;
  context.cancel     = options_.cancel;

  auto result = tool->Run(query_fasta_, context);
  if (!result.succeeded) {
    throw util::InvalidState(tool->Name() + " failed: " + result.failure);
  }
  return {result.artifacts, result.note};
}

predictor::PredictionInput StageOrchestrator::BuildPredictionInput() const {
  predictor::PredictionInput input;
  input.fasta       = query_fasta_;
  input.sequence_id = sequence_id_;
  input.sequence    = sequence_;

  if (const auto* record = checkpoint::FindStageRecord(run_, model::kSequenceAnalysisStage);
      record && record->status() == STAGE_STATUS_COMPLETED) {
    input.msa = upstream::FindAlignment({record->artifacts().begin(), record->artifacts().end()});
  }
  if (const auto* record = checkpoint::FindStageRecord(run_, model::kSecondaryStructureStage);
      record && record->status() == STAGE_STATUS_COMPLETED && record->artifacts_size() > 0) {
    input.dot_bracket = upstream::ReadDotBracket(record->artifacts(0));
  }
  return input;
}

void StageOrchestrator::RunPredictions() {
  std::vector<const model::StageSpec*> pending;
  for (const auto& spec : graph_) {
    if (spec.kind != model::StageKind::kPrediction) continue;
    if (Completed(spec.id)) {
      RNAFLOW_LOG_INFO("Skipping completed stage", {StringField("stage", spec.id)});
      continue;
    }
    try {
      CheckDependencies(spec);
    } catch (const util::UpstreamStageFailure& e) {
      store_.MarkStageFailed(run_, spec.id, e.what());
      continue;
    }
    pending.push_back(&spec);
  }
  if (pending.empty()) {
    return;
  }

  const auto& settings = options_.settings;
  const auto  input    = BuildPredictionInput();
  const auto  plan     = ensemble::Plan(settings.nstruct, settings.mc_dropout, settings.noise_scale);

  for (const auto* spec : pending) {
    store_.MarkStageStarted(run_, spec->id);
    std::error_code ec;
    std::filesystem::remove_all(options_.run_dir / kPredictionDir / spec->backend, ec);
  }

  BranchResultQueue         queue;
  std::vector<std::jthread> branches;
  for (const auto* spec : pending) {
    predictor::DispatchOptions dispatch;
    dispatch.devices    = settings.devices;
    dispatch.batch_mode = options_.batch_modes.count(spec->backend) ? options_.batch_modes.at(spec->backend) : predictor::BatchMode::kAuto;
    dispatch.output_dir = std::filesystem::absolute(options_.run_dir / kPredictionDir / spec->backend);
    dispatch.log_dir    = options_.run_dir / kLogDir / kPredictionDir;
    dispatch.timeout    = options_.prediction_timeout;
    dispatch.kill_grace = options_.kill_grace;
    dispatch.cancel     = options_.cancel;

    auto backend = toolchain_.backends.at(spec->backend);
    branches.emplace_back([&queue, &input, &plan, backend, name = spec->backend, dispatch = std::move(dispatch)] {
      BranchResult result;
      result.backend = name;
      try {
        result.ensemble = predictor::PredictorDispatcher(dispatch).Run(*backend, input, plan);
      } catch (const std::exception& e) {
        result.error = e.what();
      }
      queue.Push(std::move(result));
    });
  }

  // Results are applied in arrival order; a persistence failure stops
  // applying but still waits for every branch before propagating.
  std::exception_ptr fatal;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    auto result = queue.Pop();
    if (fatal) continue;
    try {
      const auto* spec = model::FindStage(graph_, model::PredictionStageId(result.backend));
      if (!spec) {
        throw util::InvalidState("no prediction stage for backend " + result.backend);
      }
      CompletePrediction(*spec, std::move(result));
    } catch (...) {
      fatal = std::current_exception();
    }
  }
  for (auto& branch : branches) {
    branch.join();
  }
  if (fatal) {
    std::rethrow_exception(fatal);
  }
}

void StageOrchestrator::CompletePrediction(const model::StageSpec& spec, BranchResult result) {
  if (!result.error.empty()) {
    interrupted_ = interrupted_ || Cancelled();
    store_.MarkStageFailed(run_, spec.id, Cancelled() ? "interrupted" : result.error);
    return;
  }

  auto& ensemble = result.ensemble;
  ensemble.set_backend(spec.backend);
  checkpoint::UpsertEnsemble(run_, ensemble);

  if (Cancelled()) {
    interrupted_ = true;
    store_.MarkStageFailed(run_, spec.id, "interrupted");
    return;
  }

  std::vector<std::string> artifacts;
  const EnsembleMember*    first_failure = nullptr;
  for (const auto& member : ensemble.members()) {
    if (member.failed()) {
      if (!first_failure) first_failure = &member;
      continue;
    }
    artifacts.push_back(member.structure_path());
  }

  if (artifacts.empty()) {
    util::MemberExecutionFailure failure("all " + std::to_string(ensemble.members_size()) + " members failed" +
                                         (first_failure ? "; seed " + std::to_string(first_failure->seed_index()) + ": " + first_failure->failure()
                                                        : std::string()));
    store_.MarkStageFailed(run_, spec.id, failure.what());
    return;
  }

  const auto message = std::to_string(artifacts.size()) + "/" + std::to_string(ensemble.members_size()) + " members succeeded";
  try {
    store_.MarkStageCompleted(run_, spec.id, artifacts, message);
  } catch (const util::InvalidState& e) {
    store_.MarkStageFailed(run_, spec.id, e.what());
  }
}

StageOrchestrator::StageOutput StageOrchestrator::RunClustering(const std::string& backend) {
  auto* ensemble = checkpoint::FindEnsemble(run_, backend);
  if (!ensemble) {
    throw util::InvalidState("no ensemble recorded for " + backend);
  }

  clustering::ClusteringOptions clustering_options;
  clustering_options.rmsd_threshold = options_.settings.rmsd_threshold;
  clustering_options.atom_names     = options_.settings.atom_names;
  clustering::ClusteringEngine engine(clustering_options, toolchain_.coordinate_loader);

  std::vector<StructureCluster> clusters;
  try {
    clusters = engine.Cluster(*ensemble);
  } catch (const util::ClusteringInputError& e) {
    ensemble->clear_clusters();
    ensemble->set_unclustered_fallback(true);
    RNAFLOW_LOG_WARN("Clustering failed; raw members will be scored", {StringField("backend", backend), StringField("error", e.what())});
    throw;
  }

  ensemble->clear_clusters();
  ensemble->set_unclustered_fallback(false);
  for (auto& cluster : clusters) {
    *ensemble->add_clusters() = std::move(cluster);
  }

  auto table = WriteClusterTable(options_.run_dir / kClusteringDir / backend, *ensemble);
  return {{table.string()},
          std::to_string(ensemble->clusters_size()) + " clusters from " + std::to_string(CountSucceeded(*ensemble)) + " structures"};
}

std::vector<scoring::ScoringCandidate> StageOrchestrator::CollectCandidates() const {
  std::vector<scoring::ScoringCandidate> candidates;
  for (const auto& ensemble : run_.ensembles()) {
    if (!Completed(model::PredictionStageId(ensemble.backend()))) {
      continue;
    }
    const bool use_clusters =
        options_.settings.cluster && Completed(model::ClusteringStageId(ensemble.backend())) && ensemble.clusters_size() > 0;

    std::vector<scoring::ScoringCandidate> selected;
    if (use_clusters) {
      for (const auto& cluster : ensemble.clusters()) {
        selected.push_back(ToCandidate(ensemble.members(cluster.representative())));
      }
    } else {
      for (const auto& member : ensemble.members()) {
        if (!member.failed()) selected.push_back(ToCandidate(member));
      }
    }
    std::sort(selected.begin(), selected.end(),
              [](const scoring::ScoringCandidate& a, const scoring::ScoringCandidate& b) { return a.seed_index < b.seed_index; });
    candidates.insert(candidates.end(), selected.begin(), selected.end());
  }
  return candidates;
}

StageOrchestrator::StageOutput StageOrchestrator::RunScoring() {
  run_.clear_ranking();

  auto candidates = CollectCandidates();
  if (candidates.empty()) {
    throw util::InvalidState("no backend produced any structure");
  }
  if (options_.settings.skip_scoring) {
    return {{}, "skipped (" + std::to_string(candidates.size()) + " structures)"};
  }
  if (!toolchain_.scorer->IsAvailable()) {
    throw util::InvalidState("scorer " + toolchain_.scorer->Name() + " not available");
  }

  scoring::ScoringContext context;
  context.work_dir   = options_.run_dir / kScoringDir;
  context.log_dir    = options_.run_dir / kLogDir / kScoringDir;
  context.timeout    = options_.scoring_timeout;
  context.kill_grace = options_.kill_grace;
  context.cancel     = options_.cancel;

  RNAFLOW_LOG_INFO("Scoring structures", {StringField("scorer", toolchain_.scorer->Name()), IntField("structures", static_cast<std::int64_t>(candidates.size()))});
  auto scored  = toolchain_.scorer->Score(candidates, query_fasta_, context);
  auto ranking = scoring::ConsensusRank(scored, options_.lower_is_better);
  if (Cancelled()) {
    throw util::Interrupted("interrupted");
  }
  if (ranking.empty()) {
    throw util::InvalidState("scorer produced no metrics for " + std::to_string(candidates.size()) + " structures");
  }

  ScoringReport report;
  report.set_scorer(toolchain_.scorer->Name());
  for (const auto& metric : options_.lower_is_better) {
    report.add_lower_is_better(metric);
  }
  for (const auto& entry : scored) {
    if (entry.metrics.empty()) report.add_unscored(entry.candidate.structure_id);
  }
  for (const auto& entry : ranking) {
    *report.add_ranking() = entry;
    *run_.add_ranking()   = entry;
  }

  auto artifacts = scoring::WriteScoringReport(context.work_dir, report);
  return {artifacts, std::to_string(ranking.size()) + "/" + std::to_string(candidates.size()) + " structures ranked"};
}

StageOrchestrator::StageOutput StageOrchestrator::RunReport() {
  auto path = report::WriteSummary(options_.run_dir, run_);
  return {{path.string()}, {}};
}

RunSummary StageOrchestrator::Summarize() const {
  RunSummary summary;
  summary.run         = run_;
  summary.interrupted = interrupted_;

  for (const auto& ensemble : run_.ensembles()) {
    if (Completed(model::PredictionStageId(ensemble.backend()))) {
      summary.structures += CountSucceeded(ensemble);
    }
  }

  const bool scored = Completed(model::kScoringStage) &&
                      (run_.ranking_size() > 0 || (options_.settings.skip_scoring && summary.structures > 0));
  summary.success = scored && !interrupted_;

  if (const auto* report = checkpoint::FindStageRecord(run_, model::kReportStage);
      report && report->status() == STAGE_STATUS_COMPLETED && report->artifacts_size() > 0) {
    summary.report_path = report->artifacts(0);
  }

  if (!summary.success) {
    const auto* scoring = checkpoint::FindStageRecord(run_, model::kScoringStage);
    if (scoring && scoring->status() == STAGE_STATUS_FAILED) {
      summary.failed_stage = scoring->stage_id();
      summary.failure      = scoring->message();
    } else {
      for (const auto& record : run_.stages()) {
        if (record.status() == STAGE_STATUS_FAILED) {
          summary.failed_stage = record.stage_id();
          summary.failure      = record.message();
          break;
        }
      }
    }
  }

  for (const auto& record : run_.stages()) {
    if (record.status() == STAGE_STATUS_FAILED) {
      RNAFLOW_LOG_WARN("Stage did not complete", {StringField("stage", record.stage_id()), StringField("reason", record.message())});
    }
  }
  return summary;
}

} // namespace rnaflow::orchestrator
