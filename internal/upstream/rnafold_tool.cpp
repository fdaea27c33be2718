#include "rnafold_tool.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/process/subprocess.hpp"

namespace rnaflow::upstream {

using rnaflow::observability::DoubleField;

namespace {

constexpr const char* kOutputFile = "rnafold.dot";

bool IsStructureChar(char c) {
  return c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' || c == ',' || c == '|';
}

} // namespace

RNAfoldTool::RNAfoldTool(rnaflow::config::ToolsConfig config) : config_(std::move(config)) {
}

std::string RNAfoldTool::Name() const {
  return "rnafold";
}

bool RNAfoldTool::IsAvailable() const {
  return process::IsExecutableAvailable(config_.rnafold());
}

std::string RNAfoldTool::Descriptor() const {
  return "rnafold=" + config_.rnafold();
}

std::optional<FoldResult> RNAfoldTool::ParseOutput(const std::string& stdout_text) {
  std::istringstream in(stdout_text);
  std::string        line;
  FoldResult         result;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '>') {
      continue;
    }
    if (result.sequence.empty()) {
      result.sequence = line;
      continue;
    }

    auto space = line.find(' ');
    auto token = line.substr(0, space);
    if (token.empty() || token.size() != result.sequence.size()) {
      return std::nullopt;
    }
    for (char c : token) {
      if (!IsStructureChar(c)) return std::nullopt;
    }
    result.dot_bracket = token;

    auto open  = line.find('(', space == std::string::npos ? line.size() : space);
    auto close = line.find(')', open == std::string::npos ? line.size() : open);
    if (open != std::string::npos && close != std::string::npos) {
      try {
        result.mfe = std::stod(line.substr(open + 1, close - open - 1));
      } catch (const std::exception&) {
        result.mfe = 0.0;
      }
    }
    return result;
  }
  return std::nullopt;
}

UpstreamResult RNAfoldTool::Run(const std::filesystem::path& fasta, const UpstreamContext& context) const {
  std::error_code ec;
  std::filesystem::create_directories(context.work_dir, ec);

  process::ProcessOptions options;
  options.argv        = {config_.rnafold(), "--noPS", "-p", "-i", fasta.string()};
  options.working_dir = context.work_dir;
  options.stdout_path = context.log_dir / "rnafold.stdout.log";
  options.stderr_path = context.log_dir / "rnafold.stderr.log";
  options.timeout     = context.timeout;
  options.kill_grace  = context.kill_grace;
  options.cancel      = context.cancel;

  UpstreamResult result;
  auto           run = process::RunProcess(options);
  if (!run.Succeeded()) {
    result.failure = "RNAfold " + run.Describe();
    return result;
  }

  std::ifstream      in(options.stdout_path);
  std::ostringstream text;
  text << in.rdbuf();

  auto fold = ParseOutput(text.str());
  if (!fold) {
    result.failure = "could not parse RNAfold output";
    return result;
  }

  const auto    path = context.work_dir / kOutputFile;
  std::ofstream out(path, std::ios::trunc);
  out << ">" << fasta.stem().string() << "\n"
      << fold->sequence << "\n"
      << fold->dot_bracket << " (" << std::fixed << std::setprecision(2) << fold->mfe << ")\n";
  if (!out.good()) {
    result.failure = "cannot write " + path.string();
    return result;
  }
  out.close();

  RNAFLOW_LOG_INFO("Secondary structure predicted", {DoubleField("mfe", fold->mfe)});
  result.succeeded = true;
  result.artifacts.push_back(path.string());
  std::ostringstream note;
  note << "MFE " << std::fixed << std::setprecision(2) << fold->mfe << " kcal/mol";
  result.note = note.str();
  return result;
}

std::string ReadDotBracket(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return {};
  }
  std::string line;
  std::string sequence;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '>') continue;
    if (sequence.empty()) {
      sequence = line;
      continue;
    }
    auto token = line.substr(0, line.find(' '));
    return token.size() == sequence.size() ? token : std::string();
  }
  return {};
}

} // namespace rnaflow::upstream
