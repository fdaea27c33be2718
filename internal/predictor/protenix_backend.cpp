#include "protenix_backend.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/predictor/backend_support.hpp"
#include "internal/util/errors.hpp"

namespace rnaflow::predictor {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

void WarnIgnoredFlags(const std::vector<MemberRequest>& members) {
  for (const auto& member : members) {
    if (member.dropout || member.noise_scale > 0.0) {
      RNAFLOW_LOG_DEBUG("Stochastic flags are ignored by protenix", {observability::IntField("seed_index", member.seed_index)});
    }
  }
}

} // namespace

ProtenixBackend::ProtenixBackend(rnaflow::config::ProtenixConfig config) : config_(std::move(config)) {
}

std::string ProtenixBackend::Name() const {
  return "protenix";
}

bool ProtenixBackend::IsAvailable() const {
  return process::IsExecutableAvailable(config_.binary());
}

std::string ProtenixBackend::Descriptor() const {
  return "binary=" + config_.binary() + ";model=" + config_.model() + ";base_seed=" + std::to_string(config_.base_seed());
}

bool ProtenixBackend::SupportsBatch() const {
  return true;
}

std::int64_t ProtenixBackend::SeedFor(int seed_index) const {
  return config_.base_seed() + seed_index;
}

std::string ProtenixBackend::BuildInputJson(const std::string& name, const std::string& sequence, const std::vector<std::int64_t>& seeds) {
  Struct rna;
  (*rna.mutable_fields())["sequence"].set_string_value(sequence);
  (*rna.mutable_fields())["count"].set_number_value(1);

  Struct chain;
  *(*chain.mutable_fields())["rnaSequence"].mutable_struct_value() = rna;

  Struct job;
  (*job.mutable_fields())["name"].set_string_value("rnaflow_" + name);
  auto* model_seeds = (*job.mutable_fields())["modelSeeds"].mutable_list_value();
  for (auto seed : seeds) {
    model_seeds->add_values()->set_number_value(static_cast<double>(seed));
  }
  *(*job.mutable_fields())["sequences"].mutable_list_value()->add_values()->mutable_struct_value() = chain;

  Value root;
  *root.mutable_list_value()->add_values()->mutable_struct_value() = job;

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("cannot encode protenix input: " + std::string(status.message()));
  }
  return json;
}

std::vector<MemberOutcome> ProtenixBackend::Invoke(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                                   const InvocationContext& context, const std::filesystem::path& work_dir,
                                                   const std::string& label) const {
  WarnIgnoredFlags(members);

  std::vector<std::int64_t> seeds;
  for (const auto& member : members) {
    seeds.push_back(member.seed);
  }

  const auto json_path = work_dir / "input.json";
  WriteTextFile(json_path, BuildInputJson(SanitizeLabel(input.sequence_id), input.sequence, seeds));

  std::vector<std::string> argv{config_.binary(), "pred", "-i", json_path.string(), "-o", work_dir.string()};
  if (!config_.model().empty()) {
    argv.insert(argv.end(), {"-n", config_.model()});
  }

  auto options = InvocationOptions(context, Name(), label, std::move(argv));
  auto gpu     = GpuIndex(context.device);
  if (!gpu.empty()) {
    options.env.emplace_back("CUDA_VISIBLE_DEVICES", gpu);
  }
  if (!config_.data_dir().empty()) {
    options.env.emplace_back("PROTENIX_DATA_ROOT_DIR", config_.data_dir());
  }

  auto result = process::RunProcess(options);

  std::vector<MemberOutcome> outcomes;
  for (const auto& member : members) {
    const auto needle = "/seed_" + std::to_string(member.seed) + "/";

    MemberOutcome outcome;
    outcome.seed_index     = member.seed_index;
    outcome.structure_path = FindStructure(work_dir, {".cif", ".pdb"}, needle);
    if (outcome.structure_path.empty()) {
      outcome.structure_path = work_dir / ("seed_" + std::to_string(member.seed));
    }
    outcome.process = result;
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

MemberOutcome ProtenixBackend::Predict(const PredictionInput& input, const MemberRequest& member, const InvocationContext& context) const {
  auto outcomes = Invoke(input, {member}, context, context.output_dir / ("member_" + std::to_string(member.seed_index)),
                         "seed" + std::to_string(member.seed_index));
  return std::move(outcomes.front());
}

std::vector<MemberOutcome> ProtenixBackend::PredictBatch(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                                         const InvocationContext& context) const {
  const auto label = "batch_" + SanitizeLabel(context.device);
  return Invoke(input, members, context, context.output_dir / label, label);
}

} // namespace rnaflow::predictor
