#include "report_writer.hpp"

#include <google/protobuf/util/time_util.h>

#include <fstream>
#include <iomanip>
#include <sstream>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/model/stage_graph.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/upstream/rnafold_tool.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/fasta.hpp"

namespace rnaflow::report {

using namespace rnaflow::pipeline::v1;

namespace {

std::string Fixed(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string Escape(const std::string& text) {
  std::string out;
  for (char c : text) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n' || c == '\r') {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out.size() > 120 ? out.substr(0, 117) + "..." : out;
}

void RenderInput(std::ostringstream& out, const PipelineRun& run) {
  out << "## Input\n\n";
  out << "- **Sequence ID**: " << run.sequence_id() << "\n";
  out << "- **Length**: " << run.sequence_length() << " nt\n";

  std::error_code ec;
  if (!run.input_path().empty() && std::filesystem::exists(run.input_path(), ec)) {
    auto records = util::ReadFasta(run.input_path());
    if (!records.empty() && !records.front().sequence.empty()) {
      const auto& seq = records.front().sequence;
      std::size_t gc  = 0;
      for (char c : seq) {
        if (c == 'G' || c == 'C') ++gc;
      }
      out << "- **GC content**: " << Fixed(100.0 * static_cast<double>(gc) / static_cast<double>(seq.size()), 1) << "%\n";
      out << "- **Sequence**: `" << seq << "`\n";
    }
  }

  if (const auto* ss = checkpoint::FindStageRecord(run, model::kSecondaryStructureStage)) {
    if (ss->status() == STAGE_STATUS_COMPLETED && ss->artifacts_size() > 0) {
      auto dot_bracket = upstream::ReadDotBracket(ss->artifacts(0));
      if (!dot_bracket.empty()) {
        out << "- **Secondary structure**: `" << dot_bracket << "` (" << ss->message() << ")\n";
      }
    }
  }
  out << "\n";
}

void RenderStages(std::ostringstream& out, const PipelineRun& run) {
  out << "## Stages\n\n";
  out << "| Stage | Status | Updated | Note |\n";
  out << "|-------|--------|---------|------|\n";
  for (const auto& stage : run.stages()) {
    out << "| " << stage.stage_id() << " | " << model::StatusName(stage.status()) << " | "
        << (stage.has_updated_at() ? google::protobuf::util::TimeUtil::ToString(stage.updated_at()) : "-") << " | "
        << Escape(stage.message()) << " |\n";
  }
  out << "\n";
}

void RenderEnsemble(std::ostringstream& out, const EnsembleResult& ensemble) {
  out << "### " << ensemble.backend() << "\n\n";
  out << "| Seed | Backend seed | Device | Dropout | Noise | Runtime (s) | Result |\n";
  out << "|------|--------------|--------|---------|-------|-------------|--------|\n";
  for (const auto& member : ensemble.members()) {
    out << "| " << member.seed_index() << " | " << member.seed() << " | " << member.device() << " | " << (member.dropout() ? "yes" : "no")
        << " | " << Fixed(member.noise_scale(), 3) << " | " << Fixed(member.runtime_seconds(), 1) << " | "
        << (member.failed() ? "FAILED: " + Escape(member.failure()) : std::filesystem::path(member.structure_path()).filename().string())
        << " |\n";
  }
  out << "\n";

  if (ensemble.unclustered_fallback()) {
    out << "Clustering failed; all successful members were scored.\n\n";
  }
  if (ensemble.clusters_size() == 0) {
    return;
  }
  out << "| Cluster | Population | Representative seed | Mean RMSD | Max RMSD | Members |\n";
  out << "|---------|------------|---------------------|-----------|----------|---------|\n";
  for (const auto& cluster : ensemble.clusters()) {
    std::ostringstream members;
    for (int i = 0; i < cluster.member_indices_size(); ++i) {
      if (i > 0) members << ", ";
      members << ensemble.members(cluster.member_indices(i)).seed_index();
    }
    out << "| " << cluster.cluster_id() << " | " << cluster.member_indices_size() << " | "
        << ensemble.members(cluster.representative()).seed_index() << " | " << Fixed(cluster.stats().mean_rmsd(), 2) << " | "
        << Fixed(cluster.stats().max_rmsd(), 2) << " | " << members.str() << " |\n";
  }
  out << "\n";
}

void RenderRanking(std::ostringstream& out, const PipelineRun& run) {
  out << "## Ranking\n\n";
  if (run.ranking().empty()) {
    out << "No structures were ranked.\n";
    return;
  }
  out << "| Rank | Structure | Backend | Seed | Mean rank | Metrics |\n";
  out << "|------|-----------|---------|------|-----------|---------|\n";
  for (const auto& entry : run.ranking()) {
    std::ostringstream metrics;
    for (int i = 0; i < entry.metrics_size(); ++i) {
      if (i > 0) metrics << ", ";
      metrics << entry.metrics(i).name() << "=" << Fixed(entry.metrics(i).value(), 3);
    }
    out << "| " << entry.rank() << " | " << entry.structure_id() << " | " << entry.backend() << " | " << entry.seed_index() << " | "
        << Fixed(entry.score(), 2) << " | " << metrics.str() << " |\n";
  }
}

} // namespace

std::string RenderSummary(const PipelineRun& run) {
  std::ostringstream out;
  out << "# rnaflow report\n\n";
  out << "- **Run**: " << run.run_id() << "\n";
  if (run.has_created_at()) {
    out << "- **Created**: " << google::protobuf::util::TimeUtil::ToString(run.created_at()) << "\n";
  }
  const auto& fp = run.fingerprint();
  out << "- **Backends**: ";
  for (int i = 0; i < fp.backends_size(); ++i) {
    out << (i > 0 ? ", " : "") << fp.backends(i);
  }
  out << "\n- **Ensemble size**: " << fp.nstruct() << (fp.mc_dropout() ? ", MC dropout" : "");
  if (fp.noise_scale() > 0.0) {
    out << ", noise " << Fixed(fp.noise_scale(), 3);
  }
  out << "\n- **RMSD threshold**: " << Fixed(fp.rmsd_threshold(), 2) << " A\n\n";

  RenderInput(out, run);
  RenderStages(out, run);

  out << "## Ensembles\n\n";
  if (run.ensembles().empty()) {
    out << "No ensembles were produced.\n\n";
  }
  for (const auto& ensemble : run.ensembles()) {
    RenderEnsemble(out, ensemble);
  }

  RenderRanking(out, run);
  return out.str();
}

std::filesystem::path WriteSummary(const std::filesystem::path& run_dir, const PipelineRun& run) {
  const auto      dir = run_dir / kReportDir;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw util::InvalidState("cannot create " + dir.string() + ": " + ec.message());
  }

  const auto    path = dir / kReportFile;
  std::ofstream out(path, std::ios::trunc);
  out << RenderSummary(run);
  if (!out.good()) {
    throw util::InvalidState("cannot write " + path.string());
  }
  return path;
}

std::filesystem::path RegenerateReport(const std::filesystem::path& run_dir) {
  checkpoint::CheckpointStore store(run_dir);
  auto                        run = store.Load();
  if (!run) {
    throw util::NotFound("no pipeline state in " + run_dir.string());
  }
  return WriteSummary(run_dir, *run);
}

} // namespace rnaflow::report
