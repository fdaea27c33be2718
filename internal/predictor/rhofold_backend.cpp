#include "rhofold_backend.hpp"

#include <sstream>

#include "internal/predictor/backend_support.hpp"
#include "internal/scheduler/device_scheduler.hpp"

namespace rnaflow::predictor {

namespace {

constexpr const char* kModelFile = "unrelaxed_model.pdb";

std::string FormatScale(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

RhoFoldBackend::RhoFoldBackend(rnaflow::config::RhoFoldConfig config) : config_(std::move(config)) {
}

std::string RhoFoldBackend::Name() const {
  return "rhofold";
}

bool RhoFoldBackend::IsAvailable() const {
  std::error_code ec;
  return !config_.script().empty() && std::filesystem::exists(config_.script(), ec) && process::IsExecutableAvailable(config_.python());
}

std::string RhoFoldBackend::Descriptor() const {
  return "script=" + config_.script() + ";batch_script=" + config_.batch_script() + ";model_dir=" + config_.model_dir();
}

bool RhoFoldBackend::SupportsBatch() const {
  return !config_.batch_script().empty();
}

void RhoFoldBackend::AppendCommon(std::vector<std::string>& argv, const PredictionInput& input, const std::string& device) const {
  argv.insert(argv.end(), {"--input_fas", input.fasta.string(), "--single_seq_pred", "True"});
  if (!config_.model_dir().empty()) {
    argv.insert(argv.end(), {"--ckpt", config_.model_dir()});
  }
  // The scheduler's device wins over the configured one.
  auto effective = device == scheduler::kDefaultDevice ? config_.device() : device;
  if (!effective.empty()) {
    argv.insert(argv.end(), {"--device", effective});
  }
  std::error_code ec;
  if (!input.msa.empty() && std::filesystem::exists(input.msa, ec)) {
    argv.insert(argv.end(), {"--input_a3m", input.msa.string()});
  }
}

MemberOutcome RhoFoldBackend::Predict(const PredictionInput& input, const MemberRequest& member, const InvocationContext& context) const {
  auto member_dir = SeedDirectory(context.output_dir, member.seed_index);
  std::error_code ec;
  std::filesystem::create_directories(member_dir, ec);

  std::vector<std::string> argv{config_.python(), config_.script(), "--output_dir", member_dir.string()};
  AppendCommon(argv, input, context.device);
  argv.insert(argv.end(), {"--seed", std::to_string(member.seed)});
  if (member.dropout) {
    argv.insert(argv.end(), {"--mc_dropout", "True"});
  }
  if (member.noise_scale > 0.0) {
    argv.insert(argv.end(), {"--noise_scale", FormatScale(member.noise_scale)});
  }

  auto options = InvocationOptions(context, Name(), "seed" + std::to_string(member.seed_index), std::move(argv));
  options.env.emplace_back("PYTHONHASHSEED", std::to_string(member.seed));

  MemberOutcome outcome;
  outcome.seed_index     = member.seed_index;
  outcome.structure_path = member_dir / kModelFile;
  outcome.process        = process::RunProcess(options);
  return outcome;
}

std::vector<MemberOutcome> RhoFoldBackend::PredictBatch(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                                        const InvocationContext& context) const {
  std::vector<std::int64_t> seeds;
  std::ostringstream        dropout;
  std::ostringstream        noise;
  for (std::size_t i = 0; i < members.size(); ++i) {
    seeds.push_back(members[i].seed);
    dropout << (i > 0 ? "," : "") << (members[i].dropout ? 1 : 0);
    noise << (i > 0 ? "," : "") << members[i].noise_scale;
  }

  std::error_code ec;
  std::filesystem::create_directories(context.output_dir, ec);

  std::vector<std::string> argv{config_.python(), config_.batch_script(), "--output_base_dir", context.output_dir.string()};
  AppendCommon(argv, input, context.device);
  argv.insert(argv.end(), {"--seeds", JoinSeeds(seeds), "--dropout", dropout.str(), "--noise_scales", noise.str()});

  auto result = process::RunProcess(InvocationOptions(context, Name(), "batch_" + SanitizeLabel(context.device), std::move(argv)));

  std::vector<MemberOutcome> outcomes;
  for (const auto& member : members) {
    MemberOutcome outcome;
    outcome.seed_index     = member.seed_index;
    outcome.structure_path = context.output_dir / ("run_" + std::to_string(member.seed)) / kModelFile;
    outcome.process        = result;
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

} // namespace rnaflow::predictor
