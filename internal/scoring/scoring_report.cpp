#include "scoring_report.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iomanip>
#include <set>

#include "internal/util/errors.hpp"

namespace rnaflow::scoring {

std::vector<std::string> WriteScoringReport(const std::filesystem::path& dir, const rnaflow::pipeline::v1::ScoringReport& report) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("cannot encode scoring report: " + std::string(status.message()));
  }

  const auto    json_path = dir / "scores.json";
  std::ofstream json_out(json_path, std::ios::trunc);
  json_out << json;
  if (!json_out.good()) {
    throw util::InvalidState("cannot write " + json_path.string());
  }

  const auto    tsv_path = dir / "ranking.tsv";
  std::ofstream tsv(tsv_path, std::ios::trunc);
  tsv << "rank\tstructure_id\tbackend\tseed_index\tscore";
  std::set<std::string> metric_names;
  for (const auto& entry : report.ranking()) {
    for (const auto& metric : entry.metrics()) {
      metric_names.insert(metric.name());
    }
  }
  for (const auto& name : metric_names) {
    tsv << "\t" << name;
  }
  tsv << "\tpath\n";

  for (const auto& entry : report.ranking()) {
    tsv << entry.rank() << "\t" << entry.structure_id() << "\t" << entry.backend() << "\t" << entry.seed_index() << "\t" << std::fixed
        << std::setprecision(3) << entry.score();
    for (const auto& name : metric_names) {
      tsv << "\t";
      for (const auto& metric : entry.metrics()) {
        if (metric.name() == name) {
          tsv << metric.value();
          break;
        }
      }
    }
    tsv << "\t" << entry.path() << "\n";
  }
  if (!tsv.good()) {
    throw util::InvalidState("cannot write " + tsv_path.string());
  }
  return {json_path.string(), tsv_path.string()};
}

} // namespace rnaflow::scoring
