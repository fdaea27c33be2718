#pragma once

#include "internal/predictor/predictor_backend.hpp"
#include "config/config.pb.h"

namespace rnaflow::predictor {

/*
  SimRNA (coarse-grained Monte Carlo, CPU). One replica per member, seeded
  with base_seed + seed_index; base pairs from the secondary structure are
  passed as distance restraints. The lowest-energy frame is extracted with
  SimRNA_trafl2pdbs.
*/
class SimRNABackend : public PredictorBackend {
 public:
  explicit SimRNABackend(rnaflow::config::SimRNAConfig config);

  std::string  Name() const override;
  bool         IsAvailable() const override;
  std::string  Descriptor() const override;
  std::int64_t SeedFor(int seed_index) const override;

  MemberOutcome Predict(const PredictionInput& input, const MemberRequest& member, const InvocationContext& context) const override;

  // One "DIST A i N1 A j N3 5.0 10.0 1.0" line per base pair of a dot-bracket string.
  static std::string RestraintsFromDotBracket(const std::string& dot_bracket);

 private:
  rnaflow::config::SimRNAConfig config_;
};

} // namespace rnaflow::predictor
