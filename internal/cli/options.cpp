#include "options.hpp"

#include <sstream>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace rnaflow::cli {

using rnaflow::util::ConfigurationError;

namespace {

const std::string& Value(const std::vector<std::string>& args, std::size_t& i) {
  if (i + 1 >= args.size()) {
    throw ConfigurationError("missing value for " + args[i]);
  }
  return args[++i];
}

int ParseInt(const std::string& flag, const std::string& value) {
  try {
    std::size_t used   = 0;
    int         parsed = std::stoi(value, &used);
    if (used == value.size()) return parsed;
  } catch (const std::exception&) {
  }
  throw ConfigurationError(flag + " expects an integer, got '" + value + "'");
}

double ParseDouble(const std::string& flag, const std::string& value) {
  try {
    std::size_t used   = 0;
    double      parsed = std::stod(value, &used);
    if (used == value.size()) return parsed;
  } catch (const std::exception&) {
  }
  throw ConfigurationError(flag + " expects a number, got '" + value + "'");
}

void ParseRunFlags(const std::vector<std::string>& args, std::size_t start, CliOptions& options) {
  for (std::size_t i = start; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "-o" || arg == "--output-dir") {
      options.output_dir = Value(args, i);
    } else if (arg == "-c" || arg == "--config") {
      options.config_path = Value(args, i);
    } else if (arg == "--rhofold" || arg == "--protenix" || arg == "--simrna") {
      options.backends.push_back(arg.substr(2));
    } else if (arg == "--all") {
      options.all_backends = true;
    } else if (arg == "-n" || arg == "--nstruct") {
      options.nstruct = ParseInt(arg, Value(args, i));
    } else if (arg == "--devices" || arg == "--device") {
      options.devices = SplitList(Value(args, i));
    } else if (arg == "--mc-dropout") {
      options.mc_dropout = true;
    } else if (arg == "--noise-scale") {
      options.noise_scale = ParseDouble(arg, Value(args, i));
    } else if (arg == "--rmsd-threshold") {
      options.rmsd_threshold = ParseDouble(arg, Value(args, i));
    } else if (arg == "--skip-infernal") {
      options.skip_infernal = true;
    } else if (arg == "--skip-scoring") {
      options.skip_scoring = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw ConfigurationError("unknown option " + arg);
    } else if (options.input.empty()) {
      options.input = arg;
    } else {
      throw ConfigurationError("unexpected argument " + arg);
    }
  }
}

} // namespace

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream        in(value);
  std::string              item;
  while (std::getline(in, item, ',')) {
    auto begin = item.find_first_not_of(" \t");
    auto end   = item.find_last_not_of(" \t");
    if (begin != std::string::npos) {
      out.push_back(item.substr(begin, end - begin + 1));
    }
  }
  return out;
}

CliOptions ParseArgs(const std::vector<std::string>& args) {
  CliOptions options;
  if (args.empty() || args[0] == "-h" || args[0] == "--help" || args[0] == "help") {
    return options;
  }
  if (args[0] == "-V" || args[0] == "--version") {
    options.command = Command::kVersion;
    return options;
  }

  const auto& command = args[0];
  if (command == "run") {
    options.command = Command::kRun;
    ParseRunFlags(args, 1, options);
    if (options.input.empty()) {
      throw ConfigurationError("run: missing input FASTA");
    }
  } else if (command == "report") {
    options.command = Command::kReport;
    ParseRunFlags(args, 1, options);
    if (options.input.empty()) {
      throw ConfigurationError("report: missing run directory");
    }
  } else if (command == "check") {
    options.command = Command::kCheck;
    ParseRunFlags(args, 1, options);
  } else {
    throw ConfigurationError("unknown command '" + command + "'");
  }
  return options;
}

void ApplyOverrides(const CliOptions& options, rnaflow::config::PipelineConfig* config) {
  auto* ensemble = config->mutable_ensemble();
  if (options.nstruct) {
    ensemble->set_nstruct(*options.nstruct);
  }
  if (options.mc_dropout) {
    ensemble->set_mc_dropout(true);
  }
  if (options.noise_scale) {
    ensemble->set_noise_scale(*options.noise_scale);
  }
  if (options.rmsd_threshold) {
    ensemble->set_rmsd_threshold(*options.rmsd_threshold);
  }
  if (options.devices) {
    ensemble->clear_devices();
    for (const auto& device : *options.devices) {
      ensemble->add_devices(device);
    }
  }
  if (options.verbose) {
    config->mutable_logging()->set_level("debug");
  }
}

std::vector<std::string> SelectedBackends(const CliOptions& options) {
  if (options.all_backends) {
    return factory::KnownBackends();
  }
  return options.backends;
}

std::string Usage() {
  return "Usage:\n"
         "  rnaflow run <input.fasta> [options]\n"
         "      -o, --output-dir DIR     run directory (default: rnaflow_output)\n"
         "      -c, --config FILE        YAML config file\n"
         "      --rhofold --protenix --simrna | --all\n"
         "      -n, --nstruct N          structures per backend\n"
         "      --devices d1,d2          compute devices, assigned round-robin\n"
         "      --mc-dropout             enable MC dropout for seeds >= 1\n"
         "      --noise-scale X          input noise for seeds >= 1\n"
         "      --rmsd-threshold X       clustering cutoff in Angstrom\n"
         "      --skip-infernal          skip the Rfam search\n"
         "      --skip-scoring           skip RNAdvisor scoring\n"
         "      -v, --verbose            debug logging\n"
         "  rnaflow report <run_dir> [-c FILE]\n"
         "  rnaflow check [-c FILE]\n"
         "  rnaflow --version\n";
}

} // namespace rnaflow::cli
