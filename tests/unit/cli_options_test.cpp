#include "internal/cli/options.hpp"

#include <cassert>
#include <iostream>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using rnaflow::cli::ApplyOverrides;
using rnaflow::cli::Command;
using rnaflow::cli::ParseArgs;
using rnaflow::cli::SelectedBackends;
using rnaflow::cli::SplitList;
using rnaflow::util::ConfigurationError;

template <typename Fn> bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void TestHelpAndVersion() {
  assert(ParseArgs({}).command == Command::kHelp);
  assert(ParseArgs({"--help"}).command == Command::kHelp);
  assert(ParseArgs({"help"}).command == Command::kHelp);
  assert(ParseArgs({"-V"}).command == Command::kVersion);
  assert(ParseArgs({"--version"}).command == Command::kVersion);
}

void TestRunFlags() {
  auto options = ParseArgs({"run", "query.fa", "-o", "out", "--rhofold", "--simrna", "-n", "8", "--devices", "cuda:0, cuda:1",
                            "--mc-dropout", "--noise-scale", "0.05", "--rmsd-threshold", "3.5", "--skip-infernal", "-v"});
  assert(options.command == Command::kRun);
  assert(options.input == "query.fa");
  assert(options.output_dir == "out");
  assert((options.backends == std::vector<std::string>{"rhofold", "simrna"}));
  assert(options.nstruct && *options.nstruct == 8);
  assert(options.devices && options.devices->size() == 2);
  assert((*options.devices)[1] == "cuda:1");
  assert(options.mc_dropout);
  assert(options.noise_scale && *options.noise_scale == 0.05);
  assert(options.rmsd_threshold && *options.rmsd_threshold == 3.5);
  assert(options.skip_infernal);
  assert(!options.skip_scoring);
  assert(options.verbose);
}

void TestRunDefaults() {
  auto options = ParseArgs({"run", "query.fa"});
  assert(options.output_dir == "rnaflow_output");
  assert(options.config_path.empty());
  assert(options.backends.empty());
  assert(!options.nstruct);
  assert(!options.devices);
}

void TestDeviceAlias() {
  auto options = ParseArgs({"run", "query.fa", "--device", "cuda:3"});
  assert(options.devices && options.devices->size() == 1);
  assert(options.devices->front() == "cuda:3");
}

void TestReportAndCheck() {
  auto report = ParseArgs({"report", "runs/a", "-c", "cfg.yaml"});
  assert(report.command == Command::kReport);
  assert(report.input == "runs/a");
  assert(report.config_path == "cfg.yaml");

  auto check = ParseArgs({"check"});
  assert(check.command == Command::kCheck);
}

void TestErrors() {
  assert(ThrowsConfigurationError([] { ParseArgs({"run"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"report"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"frobnicate"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"run", "q.fa", "--alphafold"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"run", "q.fa", "-n"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"run", "q.fa", "-n", "8x"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"run", "q.fa", "--noise-scale", "abc"}); }));
  assert(ThrowsConfigurationError([] { ParseArgs({"run", "q.fa", "second.fa"}); }));
}

void TestSplitList() {
  assert(SplitList("").empty());
  assert((SplitList("a,b") == std::vector<std::string>{"a", "b"}));
  assert((SplitList(" a , ,b ") == std::vector<std::string>{"a", "b"}));
}

void TestSelectedBackends() {
  auto all = ParseArgs({"run", "q.fa", "--all"});
  assert((SelectedBackends(all) == std::vector<std::string>{"protenix", "rhofold", "simrna"}));

  auto some = ParseArgs({"run", "q.fa", "--protenix"});
  assert((SelectedBackends(some) == std::vector<std::string>{"protenix"}));
}

void TestOverridesWinOverConfig() {
  auto config = rnaflow::config::ConfigLoader::Defaults();
  config.mutable_ensemble()->add_devices("cpu");

  auto options = ParseArgs({"run", "q.fa", "-n", "4", "--devices", "cuda:0,cuda:1", "--mc-dropout", "--rmsd-threshold", "2", "-v"});
  ApplyOverrides(options, &config);
  assert(config.ensemble().nstruct() == 4);
  assert(config.ensemble().mc_dropout());
  assert(config.ensemble().rmsd_threshold() == 2.0);
  assert(config.ensemble().devices_size() == 2);
  assert(config.ensemble().devices(0) == "cuda:0");
  assert(config.logging().level() == "debug");

  auto untouched = rnaflow::config::ConfigLoader::Defaults();
  const auto before = untouched.ensemble().nstruct();
  ApplyOverrides(ParseArgs({"run", "q.fa"}), &untouched);
  assert(untouched.ensemble().nstruct() == before);
  assert(!untouched.ensemble().mc_dropout());
}

} // namespace

int main() {
  TestHelpAndVersion();
  TestRunFlags();
  TestRunDefaults();
  TestDeviceAlias();
  TestReportAndCheck();
  TestErrors();
  TestSplitList();
  TestSelectedBackends();
  TestOverridesWinOverConfig();

  std::cout << "rnaflow_unit_cli_options: pass\n";
  return 0;
}
