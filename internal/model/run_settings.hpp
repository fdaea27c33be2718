#pragma once

#include <map>
#include <string>
#include <vector>

namespace rnaflow::model {

/*
  Effective settings of one pipeline invocation (config file merged with CLI
  flags). Everything that can make a cached stage stale lives here.
*/
struct RunSettings {
  std::vector<std::string> backends;
  int                      nstruct     = 1;
  bool                     mc_dropout  = false;
  double                   noise_scale = 0.0;
  std::vector<std::string> devices;

  bool                     cluster        = true;
  double                   rmsd_threshold = 5.0;
  std::vector<std::string> atom_names{"C3'", "P"};

  bool skip_sequence_analysis = false;
  bool skip_scoring           = false;

  // Canonical description of each backend adapter's own settings.
  std::map<std::string, std::string> backend_descriptors;
  std::string                        scorer_descriptor;
};

} // namespace rnaflow::model
