#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace rnaflow::cli {

enum class Command {
  kHelp,
  kVersion,
  kRun,
  kReport,
  kCheck,
};

struct CliOptions {
  Command     command = Command::kHelp;
  std::string input;
  std::string output_dir = "rnaflow_output";
  std::string config_path;

  std::vector<std::string> backends;
  bool                     all_backends = false;

  std::optional<int>                      nstruct;
  std::optional<std::vector<std::string>> devices;
  bool                                    mc_dropout = false;
  std::optional<double>                   noise_scale;
  std::optional<double>                   rmsd_threshold;

  bool skip_infernal = false;
  bool skip_scoring  = false;
  bool verbose       = false;
};

// Throws util::ConfigurationError on unknown flags, missing values or malformed numbers.
CliOptions ParseArgs(const std::vector<std::string>& args);

// CLI flags win over the config file.
void ApplyOverrides(const CliOptions& options, rnaflow::config::PipelineConfig* config);

// --all expands to every known backend; order follows the flags otherwise.
std::vector<std::string> SelectedBackends(const CliOptions& options);

// "cuda:0, cuda:1" -> {"cuda:0", "cuda:1"}
std::vector<std::string> SplitList(const std::string& value);

std::string Usage();

} // namespace rnaflow::cli
