#pragma once

#include "internal/predictor/predictor_backend.hpp"
#include "config/config.pb.h"

namespace rnaflow::predictor {

/*
  RhoFold+ (deterministic). The single form runs the inference script once
  per member; the batch form loads the model once and loops over seeds,
  writing run_<seed>/unrelaxed_model.pdb below the output directory.
*/
class RhoFoldBackend : public PredictorBackend {
 public:
  explicit RhoFoldBackend(rnaflow::config::RhoFoldConfig config);

  std::string Name() const override;
  bool        IsAvailable() const override;
  std::string Descriptor() const override;
  bool        SupportsBatch() const override;

  MemberOutcome Predict(const PredictionInput& input, const MemberRequest& member, const InvocationContext& context) const override;

  std::vector<MemberOutcome> PredictBatch(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                          const InvocationContext& context) const override;

 private:
  void AppendCommon(std::vector<std::string>& argv, const PredictionInput& input, const std::string& device) const;

  rnaflow::config::RhoFoldConfig config_;
};

} // namespace rnaflow::predictor
