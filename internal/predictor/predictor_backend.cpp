#include "predictor_backend.hpp"

#include "internal/util/errors.hpp"

namespace rnaflow::predictor {

bool PredictorBackend::SupportsBatch() const {
  return false;
}

std::int64_t PredictorBackend::SeedFor(int seed_index) const {
  return seed_index;
}

std::vector<MemberOutcome> PredictorBackend::PredictBatch(const PredictionInput&, const std::vector<MemberRequest>&,
                                                          const InvocationContext&) const {
  throw util::InvalidState(Name() + " does not support batch execution");
}

} // namespace rnaflow::predictor
