#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/scoring/scorer.hpp"
#include "config/config.pb.h"

namespace rnaflow::scoring {

/*
  RNAdvisor 2, run natively or through docker. Each structure is staged
  into its own directory and scored separately so that one unreadable
  model does not lose the scores of the others.
*/
class RNAdvisorScorer : public Scorer {
 public:
  explicit RNAdvisorScorer(rnaflow::config::ScoringConfig config);

  std::string Name() const override;
  bool        IsAvailable() const override;
  std::string Descriptor() const override;

  std::vector<ScoredStructure> Score(const std::vector<ScoringCandidate>& candidates, const std::filesystem::path& input_fasta,
                                     const ScoringContext& context) const override;

  // Numeric columns of the first data row of an RNAdvisor CSV.
  static std::vector<std::pair<std::string, double>> ParseCsv(const std::string& csv);

 private:
  std::vector<std::string> Command(const std::filesystem::path& stage_dir, const std::filesystem::path& out_csv) const;

  rnaflow::config::ScoringConfig config_;
};

} // namespace rnaflow::scoring
