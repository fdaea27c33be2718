#include "stage_graph.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "internal/util/digest.hpp"

namespace rnaflow::model {

namespace {

std::string Join(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    if (!out.empty()) {
      out += ',';
    }
    out += value;
  }
  return out;
}

std::string Canonical(double value) {
  std::ostringstream out;
  out.precision(17);
  out << value;
  return out.str();
}

std::string SequenceKey(const std::string& sequence) {
  return "seq=" + util::HexDigest(sequence) + ";len=" + std::to_string(sequence.size());
}

std::string PredictionKey(const RunSettings& settings, const std::string& backend, const std::string& sequence) {
  auto descriptor = settings.backend_descriptors.find(backend);

  std::ostringstream out;
  out << SequenceKey(sequence) << ";backend=" << backend;
  out << ";adapter=" << (descriptor == settings.backend_descriptors.end() ? std::string() : descriptor->second);
  out << ";nstruct=" << settings.nstruct;
  out << ";mc_dropout=" << (settings.mc_dropout ? 1 : 0);
  out << ";noise=" << Canonical(settings.noise_scale);
  out << ";devices=" << Join(settings.devices);
  return out.str();
}

} // namespace

std::string PredictionStageId(const std::string& backend) {
  return "prediction/" + backend;
}

std::string ClusteringStageId(const std::string& backend) {
  return "clustering/" + backend;
}

std::vector<StageSpec> BuildStageGraph(const RunSettings& settings, const std::string& sequence) {
  std::set<std::string> backends(settings.backends.begin(), settings.backends.end());

  std::vector<StageSpec> graph;

  graph.push_back(StageSpec{kSequenceAnalysisStage, StageKind::kSequenceAnalysis, {}, {}, {},
                            util::HexDigest(SequenceKey(sequence) + ";skip=" + (settings.skip_sequence_analysis ? "1" : "0"))});

  graph.push_back(StageSpec{kSecondaryStructureStage, StageKind::kSecondaryStructure, {}, {kSequenceAnalysisStage}, {},
                            util::HexDigest(SequenceKey(sequence))});

  std::vector<std::string> scoring_follows;
  for (const auto& backend : backends) {
    graph.push_back(StageSpec{PredictionStageId(backend), StageKind::kPrediction, backend, {kSecondaryStructureStage}, {},
                              util::HexDigest(PredictionKey(settings, backend, sequence))});
    scoring_follows.push_back(PredictionStageId(backend));
  }

  if (settings.cluster) {
    for (const auto& backend : backends) {
      std::ostringstream key;
      key << PredictionKey(settings, backend, sequence);
      key << ";threshold=" << Canonical(settings.rmsd_threshold);
      key << ";atoms=" << Join(settings.atom_names);
      graph.push_back(StageSpec{ClusteringStageId(backend), StageKind::kClustering, backend, {PredictionStageId(backend)}, {},
                                util::HexDigest(key.str())});
      scoring_follows.push_back(ClusteringStageId(backend));
    }
  }

  std::ostringstream scoring_key;
  scoring_key << "backends=" << Join(std::vector<std::string>(backends.begin(), backends.end()));
  scoring_key << ";cluster=" << (settings.cluster ? 1 : 0);
  scoring_key << ";skip=" << (settings.skip_scoring ? 1 : 0);
  scoring_key << ";scorer=" << settings.scorer_descriptor;
  auto scoring_fingerprint = util::HexDigest(scoring_key.str());
  graph.push_back(StageSpec{kScoringStage, StageKind::kScoring, {}, {}, scoring_follows, scoring_fingerprint});

  graph.push_back(StageSpec{kReportStage, StageKind::kReport, {}, {}, {kScoringStage}, util::HexDigest("report;" + scoring_fingerprint)});

  return graph;
}

std::vector<std::string> Downstream(const std::vector<StageSpec>& graph, const std::string& stage_id) {
  std::set<std::string>    reached{stage_id};
  std::vector<std::string> out;

  // Graph order is topological, so a single forward pass closes the set.
  for (const auto& stage : graph) {
    auto upstream_reached = [&](const std::vector<std::string>& ids) {
      return std::any_of(ids.begin(), ids.end(), [&](const std::string& id) { return reached.count(id) > 0; });
    };
    if (stage.id != stage_id && (upstream_reached(stage.depends_on) || upstream_reached(stage.follows))) {
      reached.insert(stage.id);
      out.push_back(stage.id);
    }
  }
  return out;
}

const StageSpec* FindStage(const std::vector<StageSpec>& graph, const std::string& stage_id) {
  for (const auto& stage : graph) {
    if (stage.id == stage_id) {
      return &stage;
    }
  }
  return nullptr;
}

std::string RunDigest(const RunSettings& settings, const std::string& sequence) {
  std::ostringstream key;
  for (const auto& stage : BuildStageGraph(settings, sequence)) {
    key << stage.id << '=' << stage.fingerprint << ';';
  }
  return util::HexDigest(key.str());
}

} // namespace rnaflow::model
