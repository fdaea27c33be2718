#include "diversity_controller.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace rnaflow::ensemble {

using rnaflow::pipeline::v1::EnsembleMember;

std::vector<EnsembleMember> Plan(int nstruct, bool mc_dropout, double noise_scale) {
  if (nstruct < 1) {
    throw util::ConfigurationError("nstruct must be at least 1, got " + std::to_string(nstruct));
  }
  if (noise_scale < 0.0) {
    throw util::ConfigurationError("noise_scale must not be negative");
  }

  std::vector<EnsembleMember> plan;
  plan.reserve(static_cast<std::size_t>(nstruct));
  for (int i = 0; i < nstruct; ++i) {
    EnsembleMember member;
    member.set_seed_index(i);
    if (i > 0) {
      member.set_dropout(mc_dropout);
      member.set_noise_scale(noise_scale);
    }
    plan.push_back(std::move(member));
  }
  return plan;
}

} // namespace rnaflow::ensemble
