#pragma once

#include "internal/predictor/predictor_backend.hpp"
#include "config/config.pb.h"

namespace rnaflow::predictor {

/*
  Protenix. All seeds of one device go into a single input JSON
  (modelSeeds); the device is pinned through CUDA_VISIBLE_DEVICES.
  Backend seeds are base_seed + seed_index.
*/
class ProtenixBackend : public PredictorBackend {
 public:
  explicit ProtenixBackend(rnaflow::config::ProtenixConfig config);

  std::string  Name() const override;
  bool         IsAvailable() const override;
  std::string  Descriptor() const override;
  bool         SupportsBatch() const override;
  std::int64_t SeedFor(int seed_index) const override;

  MemberOutcome Predict(const PredictionInput& input, const MemberRequest& member, const InvocationContext& context) const override;

  std::vector<MemberOutcome> PredictBatch(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                          const InvocationContext& context) const override;

  // Protenix inference input for one RNA chain.
  static std::string BuildInputJson(const std::string& name, const std::string& sequence, const std::vector<std::int64_t>& seeds);

 private:
  std::vector<MemberOutcome> Invoke(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                    const InvocationContext& context, const std::filesystem::path& work_dir,
                                    const std::string& label) const;

  rnaflow::config::ProtenixConfig config_;
};

} // namespace rnaflow::predictor
