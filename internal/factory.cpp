#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/predictor/protenix_backend.hpp"
#include "internal/predictor/rhofold_backend.hpp"
#include "internal/predictor/simrna_backend.hpp"
#include "internal/scoring/rnadvisor_scorer.hpp"
#include "internal/upstream/infernal_tool.hpp"
#include "internal/upstream/rnafold_tool.hpp"

namespace rnaflow::factory {

using namespace rnaflow;

namespace {

std::chrono::milliseconds Seconds(double seconds) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

} // namespace

const std::vector<std::string>& KnownBackends() {
  static const std::vector<std::string> kBackends = {"protenix", "rhofold", "simrna"};
  return kBackends;
}

orchestrator::Toolchain BuildToolchain(const config::PipelineConfig& config) {
  orchestrator::Toolchain toolchain;
  toolchain.sequence_analysis   = std::make_shared<upstream::InfernalTool>(config.tools());
  toolchain.secondary_structure = std::make_shared<upstream::RNAfoldTool>(config.tools());

  toolchain.backends["rhofold"]  = std::make_shared<predictor::RhoFoldBackend>(config.backends().rhofold());
  toolchain.backends["protenix"] = std::make_shared<predictor::ProtenixBackend>(config.backends().protenix());
  toolchain.backends["simrna"]   = std::make_shared<predictor::SimRNABackend>(config.backends().simrna());

  toolchain.scorer = std::make_shared<scoring::RNAdvisorScorer>(config.scoring());
  return toolchain;
}

std::map<std::string, predictor::BatchMode> BatchModes(const config::PipelineConfig& config) {
  const auto& backends = config.backends();
  return {
      {"rhofold", predictor::ParseBatchMode(backends.rhofold().batch_mode())},
      {"protenix", predictor::ParseBatchMode(backends.protenix().batch_mode())},
      {"simrna", predictor::ParseBatchMode(backends.simrna().batch_mode())},
  };
}

orchestrator::RunOptions BuildRunOptions(const config::PipelineConfig& config, const RunRequest& request) {
  const auto& ensemble = config.ensemble();

  orchestrator::RunOptions options;
  options.input_fasta = request.input_fasta;
  options.run_dir     = request.run_dir;

  auto& settings                  = options.settings;
  settings.backends               = request.backends;
  settings.nstruct                = ensemble.nstruct();
  settings.mc_dropout             = ensemble.mc_dropout();
  settings.noise_scale            = ensemble.noise_scale();
  settings.devices                = {ensemble.devices().begin(), ensemble.devices().end()};
  settings.cluster                = !ensemble.has_cluster() || ensemble.cluster();
  settings.rmsd_threshold         = ensemble.rmsd_threshold();
  settings.atom_names             = {ensemble.atom_names().begin(), ensemble.atom_names().end()};
  settings.skip_sequence_analysis = request.skip_sequence_analysis;
  settings.skip_scoring           = request.skip_scoring;

  options.batch_modes     = BatchModes(config);
  options.lower_is_better = {config.scoring().lower_is_better().begin(), config.scoring().lower_is_better().end()};

  options.tool_timeout       = Seconds(config.tools().timeout_seconds());
  options.prediction_timeout = Seconds(config.dispatch().timeout_seconds());
  options.scoring_timeout    = Seconds(config.scoring().timeout_seconds());
  options.kill_grace         = Seconds(config.dispatch().kill_grace_seconds());
  options.cancel             = request.cancel;
  return options;
}

} // namespace rnaflow::factory
