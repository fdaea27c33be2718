#include "rnadvisor_scorer.hpp"

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/process/subprocess.hpp"

namespace rnaflow::scoring {

using rnaflow::observability::IntField;
using rnaflow::observability::StringField;

namespace {

std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string              field;
  bool                     quoted = false;
  for (char c : line) {
    if (c == '"') {
      quoted = !quoted;
    } else if (c == ',' && !quoted) {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field.push_back(c);
    }
  }
  fields.push_back(field);
  return fields;
}

std::string JoinMetrics(const google::protobuf::RepeatedPtrField<std::string>& metrics) {
  std::string out;
  for (const auto& metric : metrics) {
    if (!out.empty()) out += ",";
    out += metric;
  }
  return out;
}

} // namespace

RNAdvisorScorer::RNAdvisorScorer(rnaflow::config::ScoringConfig config) : config_(std::move(config)) {
}

std::string RNAdvisorScorer::Name() const {
  return "rnadvisor";
}

bool RNAdvisorScorer::IsAvailable() const {
  return process::IsExecutableAvailable(config_.docker() ? "docker" : config_.binary());
}

std::string RNAdvisorScorer::Descriptor() const {
  return std::string("rnadvisor;docker=") + (config_.docker() ? config_.docker_image() : "no") + ";metrics=" + JoinMetrics(config_.metrics()) +
         ";lower_is_better=" + JoinMetrics(config_.lower_is_better());
}

std::vector<std::pair<std::string, double>> RNAdvisorScorer::ParseCsv(const std::string& csv) {
  std::istringstream in(csv);
  std::string        header_line;
  std::string        row_line;
  if (!std::getline(in, header_line)) {
    return {};
  }
  while (std::getline(in, row_line) && row_line.find_first_not_of(" \r") == std::string::npos) {
  }

  auto header = SplitCsvLine(header_line);
  auto row    = SplitCsvLine(row_line);

  std::vector<std::pair<std::string, double>> metrics;
  for (std::size_t i = 0; i < header.size() && i < row.size(); ++i) {
    const auto& name = header[i];
    if (name.empty() || name == "name" || name == "pdb" || name == "file" || row[i].empty()) {
      continue;
    }
    try {
      std::size_t used  = 0;
      double      value = std::stod(row[i], &used);
      if (used == row[i].size()) {
        metrics.emplace_back(name, value);
      }
    } catch (const std::exception&) {
      // non-numeric column
    }
  }
  return metrics;
}

std::vector<std::string> RNAdvisorScorer::Command(const std::filesystem::path& stage_dir, const std::filesystem::path& out_csv) const {
  const auto metrics = JoinMetrics(config_.metrics());
  if (!config_.docker()) {
    return {config_.binary(), "--pred_dir", stage_dir.string(), "--scores", metrics, "--out_path", out_csv.string()};
  }
  return {"docker",
          "run",
          "--rm",
          "-v",
          stage_dir.string() + ":/data/pred",
          "-v",
          out_csv.parent_path().string() + ":/data/out",
          config_.docker_image(),
          "--pred_dir",
          "/data/pred",
          "--scores",
          metrics,
          "--out_path",
          "/data/out/" + out_csv.filename().string()};
}

std::vector<ScoredStructure> RNAdvisorScorer::Score(const std::vector<ScoringCandidate>& candidates, const std::filesystem::path&,
                                                    const ScoringContext& context) const {
  std::vector<ScoredStructure> scored;
  for (const auto& candidate : candidates) {
    ScoredStructure entry;
    entry.candidate = candidate;

    if (context.cancel && context.cancel->load()) {
      scored.push_back(std::move(entry));
      continue;
    }

    std::error_code ec;
    const auto      source    = std::filesystem::path(candidate.path);
    const auto      stage_dir = std::filesystem::absolute(context.work_dir / ("stage_" + candidate.structure_id), ec);
    std::filesystem::remove_all(stage_dir, ec);
    std::filesystem::create_directories(stage_dir, ec);
    std::filesystem::copy_file(source, stage_dir / (candidate.structure_id + source.extension().string()),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      RNAFLOW_LOG_WARN("Could not stage structure for scoring", {StringField("structure", candidate.structure_id), StringField("error", ec.message())});
      scored.push_back(std::move(entry));
      continue;
    }

    const auto out_csv = std::filesystem::absolute(context.work_dir / ("scores_" + candidate.structure_id + ".csv"), ec);

    process::ProcessOptions options;
    options.argv        = Command(stage_dir, out_csv);
    options.stdout_path = context.log_dir / ("rnadvisor_" + candidate.structure_id + ".stdout.log");
    options.stderr_path = context.log_dir / ("rnadvisor_" + candidate.structure_id + ".stderr.log");
    options.timeout     = context.timeout;
    options.kill_grace  = context.kill_grace;
    options.cancel      = context.cancel;

    auto result = process::RunProcess(options);
    if (!result.Succeeded()) {
      RNAFLOW_LOG_WARN("RNAdvisor failed", {StringField("structure", candidate.structure_id), StringField("error", result.Describe())});
      scored.push_back(std::move(entry));
      continue;
    }

    std::ifstream      in(out_csv);
    std::ostringstream text;
    text << in.rdbuf();
    entry.metrics = ParseCsv(text.str());
    RNAFLOW_LOG_DEBUG("Scored structure", {StringField("structure", candidate.structure_id),
                                           IntField("metrics", static_cast<std::int64_t>(entry.metrics.size()))});
    scored.push_back(std::move(entry));
  }
  return scored;
}

} // namespace rnaflow::scoring
