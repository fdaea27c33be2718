#pragma once

#include <vector>

#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::ensemble {

/*
  Plans the members of one ensemble.

  Seed index 0 is always the deterministic baseline: dropout off and zero
  noise whatever flags were requested. Members 1..nstruct-1 carry the
  requested stochastic flags verbatim. With nstruct == 1 only the baseline
  is planned and the flags have no effect.

  Returned members have backend, seed_index, dropout and noise_scale set;
  the backend-specific seed and the device are assigned later.
*/
std::vector<rnaflow::pipeline::v1::EnsembleMember> Plan(int nstruct, bool mc_dropout, double noise_scale);

} // namespace rnaflow::ensemble
