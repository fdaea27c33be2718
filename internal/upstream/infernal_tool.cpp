#include "infernal_tool.hpp"

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/process/subprocess.hpp"

namespace rnaflow::upstream {

using rnaflow::observability::DoubleField;
using rnaflow::observability::StringField;

namespace {

process::ProcessOptions Options(const UpstreamContext& context, const std::string& label, std::vector<std::string> argv) {
  process::ProcessOptions options;
  options.argv        = std::move(argv);
  options.working_dir = context.work_dir;
  options.stdout_path = context.log_dir / (label + ".stdout.log");
  options.stderr_path = context.log_dir / (label + ".stderr.log");
  options.timeout     = context.timeout;
  options.kill_grace  = context.kill_grace;
  options.cancel      = context.cancel;
  return options;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace

InfernalTool::InfernalTool(rnaflow::config::ToolsConfig config) : config_(std::move(config)) {
}

std::string InfernalTool::Name() const {
  return "infernal";
}

bool InfernalTool::IsAvailable() const {
  std::error_code ec;
  return process::IsExecutableAvailable(config_.cmscan()) && !config_.rfam_cm().empty() &&
         std::filesystem::exists(config_.rfam_cm(), ec);
}

std::string InfernalTool::Descriptor() const {
  return "cmscan=" + config_.cmscan() + ";rfam_cm=" + config_.rfam_cm() + ";clanin=" + config_.rfam_clanin();
}

std::optional<RfamHit> InfernalTool::ParseTopHit(const std::string& tblout) {
  std::istringstream in(tblout);
  std::string        line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::istringstream       fields(line);
    std::vector<std::string> columns;
    std::string              field;
    while (fields >> field) {
      columns.push_back(field);
    }
    if (columns.size() < 18) {
      continue;
    }
    RfamHit hit;
    hit.family    = columns[1];
    hit.accession = columns[2];
    try {
      hit.evalue = std::stod(columns[17]);
    } catch (const std::exception&) {
      continue;
    }
    return hit;
  }
  return std::nullopt;
}

UpstreamResult InfernalTool::Run(const std::filesystem::path& fasta, const UpstreamContext& context) const {
  std::error_code ec;
  std::filesystem::create_directories(context.work_dir, ec);

  const auto tblout = context.work_dir / "cmscan.tblout";
  const auto output = context.work_dir / "cmscan.out";

  std::vector<std::string> argv{config_.cmscan(), "--cut_ga", "--rfam", "--nohmmonly", "--fmt", "2", "--tblout", tblout.string(),
                                "-o", output.string()};
  if (!config_.rfam_clanin().empty() && std::filesystem::exists(config_.rfam_clanin(), ec)) {
    argv.insert(argv.end(), {"--clanin", config_.rfam_clanin()});
  }
  argv.insert(argv.end(), {config_.rfam_cm(), fasta.string()});

  UpstreamResult result;
  auto           scan = process::RunProcess(Options(context, "cmscan", std::move(argv)));
  if (!scan.Succeeded()) {
    result.failure = "cmscan " + scan.Describe();
    return result;
  }

  result.succeeded = true;
  result.artifacts.push_back(tblout.string());

  auto hit = ParseTopHit(ReadFile(tblout));
  if (!hit) {
    result.note = "no Rfam hit";
    RNAFLOW_LOG_INFO("No Rfam family found");
    return result;
  }
  RNAFLOW_LOG_INFO("Rfam hit", {StringField("family", hit->family), DoubleField("evalue", hit->evalue)});
  result.note = "Rfam " + hit->family + " (" + hit->accession + ")";

  const auto family_cm = context.work_dir / (hit->family + ".cm");
  auto fetch = process::RunProcess(Options(context, "cmfetch", {config_.cmfetch(), "-o", family_cm.string(), config_.rfam_cm(), hit->family}));
  if (!fetch.Succeeded()) {
    RNAFLOW_LOG_WARN("cmfetch failed; continuing without alignment", {StringField("family", hit->family)});
    return result;
  }

  const auto alignment = context.work_dir / "alignment.sto";
  auto align = process::RunProcess(
      Options(context, "cmalign", {config_.cmalign(), "--outformat", "Stockholm", "-o", alignment.string(), family_cm.string(), fasta.string()}));
  if (!align.Succeeded()) {
    RNAFLOW_LOG_WARN("cmalign failed; continuing without alignment", {StringField("family", hit->family)});
    return result;
  }
  result.artifacts.push_back(alignment.string());
  return result;
}

std::string FindAlignment(const std::vector<std::string>& artifacts) {
  for (const auto& artifact : artifacts) {
    auto ext = std::filesystem::path(artifact).extension();
    if (ext == ".sto" || ext == ".a3m") {
      return artifact;
    }
  }
  return {};
}

} // namespace rnaflow::upstream
