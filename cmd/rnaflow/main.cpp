#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/options.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/orchestrator/stage_orchestrator.hpp"
#include "internal/report/report_writer.hpp"
#include "internal/runtime/interrupt.hpp"
#include "internal/util/errors.hpp"
#include "rnaflow/pipeline/v1.hpp"

using rnaflow::observability::IntField;
using rnaflow::observability::StringField;

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitFailure     = 1;
constexpr int kExitUsage       = 2;
constexpr int kExitPersistence = 3;
constexpr int kExitInterrupted = 130;

rnaflow::config::PipelineConfig LoadConfig(const rnaflow::cli::CliOptions& options) {
  auto config = options.config_path.empty() ? rnaflow::config::ConfigLoader::Defaults()
                                            : rnaflow::config::ConfigLoader::LoadFromYaml(options.config_path);
  rnaflow::cli::ApplyOverrides(options, &config);
  rnaflow::config::ConfigLoader::Validate(config);
  return config;
}

void PrintRow(const std::string& name, bool available, const std::string& detail) {
  std::cout << "  " << std::left << std::setw(22) << name << std::setw(11) << (available ? "OK" : "NOT FOUND") << detail
            << "\n";
}

int Check(const rnaflow::config::PipelineConfig& config) {
  auto toolchain = rnaflow::factory::BuildToolchain(config);

  std::cout << "rnaflow " << rnaflow::kVersion << " tool availability\n";
  for (const auto& tool : {toolchain.sequence_analysis, toolchain.secondary_structure}) {
    PrintRow(tool->Name(), tool->IsAvailable(), tool->Descriptor());
  }
  for (const auto& [name, backend] : toolchain.backends) {
    PrintRow(name, backend->IsAvailable(), backend->Descriptor() + (backend->SupportsBatch() ? " (batch)" : ""));
  }
  PrintRow(toolchain.scorer->Name(), toolchain.scorer->IsAvailable(), toolchain.scorer->Descriptor());
  return kExitOk;
}

int Report(const rnaflow::cli::CliOptions& options) {
  auto path = rnaflow::report::RegenerateReport(options.input);
  std::cout << "Report regenerated: " << path.string() << "\n";
  return kExitOk;
}

int Run(const rnaflow::cli::CliOptions& options, const rnaflow::config::PipelineConfig& config) {
  const std::filesystem::path run_dir = options.output_dir;
  if (config.logging().log_to_file()) {
    rnaflow::observability::AttachLogFile(run_dir / "logs" / "rnaflow.log");
  }

  rnaflow::factory::RunRequest request;
  request.input_fasta            = options.input;
  request.run_dir                = run_dir;
  request.backends               = rnaflow::cli::SelectedBackends(options);
  request.skip_sequence_analysis = options.skip_infernal;
  request.skip_scoring           = options.skip_scoring;
  request.cancel                 = &rnaflow::runtime::InterruptFlag();

  RNAFLOW_LOG_INFO("Starting run", {StringField("version", rnaflow::kVersion), StringField("input", options.input),
                                    StringField("run_dir", run_dir.string()),
                                    IntField("backends", static_cast<std::int64_t>(request.backends.size()))});

  rnaflow::orchestrator::StageOrchestrator orchestrator(rnaflow::factory::BuildToolchain(config),
                                                        rnaflow::factory::BuildRunOptions(config, request));
  auto summary = orchestrator.Run();

  if (summary.interrupted) {
    std::cerr << "Interrupted; rerun the same command to resume.\n";
    return kExitInterrupted;
  }
  if (!summary.success) {
    std::cerr << "Run failed";
    if (!summary.failed_stage.empty()) {
      std::cerr << " at stage " << summary.failed_stage;
    }
    if (!summary.failure.empty()) {
      std::cerr << ": " << summary.failure;
    }
    std::cerr << "\n";
    return kExitFailure;
  }

  std::cout << "Done. " << summary.structures << " structure(s); summary at " << summary.report_path.string() << "\n";
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  rnaflow::cli::CliOptions options;
  try {
    options = rnaflow::cli::ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const rnaflow::util::ConfigurationError& e) {
    std::cerr << "error: " << e.what() << "\n\n" << rnaflow::cli::Usage();
    return kExitUsage;
  }

  if (options.command == rnaflow::cli::Command::kHelp) {
    std::cout << rnaflow::cli::Usage();
    return kExitOk;
  }
  if (options.command == rnaflow::cli::Command::kVersion) {
    std::cout << "rnaflow " << rnaflow::kVersion << "\n";
    return kExitOk;
  }

  int code = kExitOk;
  try {
    auto config = LoadConfig(options);
    rnaflow::observability::InitializeLogging(config.logging(), options.verbose);

    // Register signal handlers before any subprocess is launched.
    rnaflow::runtime::InstallSignalHandlers();

    switch (options.command) {
      case rnaflow::cli::Command::kCheck:
        code = Check(config);
        break;
      case rnaflow::cli::Command::kReport:
        code = Report(options);
        break;
      default:
        code = Run(options, config);
        break;
    }
  } catch (const rnaflow::util::ConfigurationError& e) {
    std::cerr << "configuration error: " << e.what() << "\n";
    code = kExitUsage;
  } catch (const rnaflow::util::PersistenceError& e) {
    RNAFLOW_LOG_ERROR("Checkpoint write failed", {StringField("error", e.what())});
    code = kExitPersistence;
  } catch (const rnaflow::util::NotFound& e) {
    std::cerr << "error: " << e.what() << "\n";
    code = kExitUsage;
  } catch (const std::exception& e) {
    RNAFLOW_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    code = kExitFailure;
  }

  rnaflow::observability::ShutdownLogging();
  return code;
}
