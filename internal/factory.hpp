#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/orchestrator/stage_orchestrator.hpp"
#include "internal/predictor/predictor_dispatcher.hpp"

namespace rnaflow::factory {

// Backends known to this build, sorted.
const std::vector<std::string>& KnownBackends();

/*
  BuildToolchain

  Constructs every external collaborator from the pipeline config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete adapter types.
*/
orchestrator::Toolchain BuildToolchain(const rnaflow::config::PipelineConfig& config);

std::map<std::string, predictor::BatchMode> BatchModes(const rnaflow::config::PipelineConfig& config);

struct RunRequest {
  std::filesystem::path    input_fasta;
  std::filesystem::path    run_dir;
  std::vector<std::string> backends;
  bool                     skip_sequence_analysis = false;
  bool                     skip_scoring           = false;
  const std::atomic<bool>* cancel                 = nullptr;
};

// Effective run options: config values (already merged with CLI overrides) plus the request.
orchestrator::RunOptions BuildRunOptions(const rnaflow::config::PipelineConfig& config, const RunRequest& request);

} // namespace rnaflow::factory
