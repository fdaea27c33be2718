#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/scoring/scorer.hpp"
#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::scoring {

/*
  Mean-rank consensus. For every metric, structures that carry it are
  ranked 1..k (ascending values for metrics in `lower_is_better`,
  descending otherwise, ties by structure id); a structure's score is the
  mean of its ranks. Output is sorted by score, then structure id.
  Structures without metrics are left out.
*/
std::vector<rnaflow::pipeline::v1::RankedStructure> ConsensusRank(const std::vector<ScoredStructure>& scored,
                                                                  const std::set<std::string>& lower_is_better);

} // namespace rnaflow::scoring
