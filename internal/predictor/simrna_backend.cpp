#include "simrna_backend.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/predictor/backend_support.hpp"

namespace rnaflow::predictor {

using rnaflow::observability::IntField;
using rnaflow::observability::StringField;

SimRNABackend::SimRNABackend(rnaflow::config::SimRNAConfig config) : config_(std::move(config)) {
}

std::string SimRNABackend::Name() const {
  return "simrna";
}

bool SimRNABackend::IsAvailable() const {
  return process::IsExecutableAvailable(config_.binary());
}

std::string SimRNABackend::Descriptor() const {
  return "binary=" + config_.binary() + ";config=" + config_.config_file() + ";steps=" + std::to_string(config_.steps()) +
         ";base_seed=" + std::to_string(config_.base_seed());
}

std::int64_t SimRNABackend::SeedFor(int seed_index) const {
  return config_.base_seed() + seed_index;
}

std::string SimRNABackend::RestraintsFromDotBracket(const std::string& dot_bracket) {
  std::ostringstream out;
  std::vector<std::size_t> stack;
  for (std::size_t i = 0; i < dot_bracket.size(); ++i) {
    if (dot_bracket[i] == '(') {
      stack.push_back(i);
    } else if (dot_bracket[i] == ')' && !stack.empty()) {
      auto j = stack.back();
      stack.pop_back();
      out << "DIST A " << j + 1 << " N1 A " << i + 1 << " N3 5.0 10.0 1.0\n";
    }
  }
  return out.str();
}

MemberOutcome SimRNABackend::Predict(const PredictionInput& input, const MemberRequest& member, const InvocationContext& context) const {
  if (member.dropout || member.noise_scale > 0.0) {
    RNAFLOW_LOG_DEBUG("Stochastic flags are ignored by simrna", {IntField("seed_index", member.seed_index)});
  }

  const auto member_dir = SeedDirectory(context.output_dir, member.seed_index);
  const auto label      = "seed" + std::to_string(member.seed_index);

  auto structure = input.dot_bracket.size() == input.sequence.size() ? input.dot_bracket : std::string(input.sequence.size(), '.');
  const auto seq_path = member_dir / "input.seq";
  WriteTextFile(seq_path, input.sequence + "\n" + structure + "\n");

  std::vector<std::string> argv{config_.binary(), "-s", seq_path.string(), "-o", (member_dir / "simrna_run").string(), "-n",
                                std::to_string(config_.steps()), "-R", std::to_string(member.seed)};
  if (!config_.config_file().empty()) {
    argv.insert(argv.end(), {"-c", config_.config_file()});
  }
  auto restraints = RestraintsFromDotBracket(structure);
  if (!restraints.empty()) {
    const auto restraints_path = member_dir / "restraints.txt";
    WriteTextFile(restraints_path, restraints);
    argv.insert(argv.end(), {"-r", restraints_path.string()});
  }

  auto options        = InvocationOptions(context, Name(), label, std::move(argv));
  options.working_dir = member_dir;

  MemberOutcome outcome;
  outcome.seed_index = member.seed_index;
  outcome.process    = process::RunProcess(options);
  if (!outcome.process.Succeeded()) {
    outcome.structure_path = member_dir / "simrna_run.pdb";
    return outcome;
  }

  auto trafl = FindStructure(member_dir, {".trafl"});
  if (!trafl.empty() && process::IsExecutableAvailable(config_.trafl2pdbs())) {
    auto extract        = InvocationOptions(context, Name(), label + "_trafl2pdbs", {config_.trafl2pdbs(), trafl.string(), "1"});
    extract.working_dir = member_dir;
    auto extracted      = process::RunProcess(extract);
    if (!extracted.Succeeded()) {
      outcome.error = "SimRNA_trafl2pdbs failed: " + extracted.Describe();
    }
  } else if (!trafl.empty()) {
    RNAFLOW_LOG_WARN("SimRNA_trafl2pdbs not available; trajectory left unextracted",
                     {StringField("trajectory", trafl.string())});
  }

  outcome.structure_path = FindStructure(member_dir, {".pdb"}, "/simrna_run");
  if (outcome.structure_path.empty()) {
    outcome.structure_path = member_dir / "simrna_run.pdb";
  }
  return outcome;
}

} // namespace rnaflow::predictor
