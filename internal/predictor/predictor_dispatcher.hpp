#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/predictor/predictor_backend.hpp"
#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::predictor {

enum class BatchMode {
  kAuto,
  kBatch,
  kPerMember,
};

// Accepts "auto", "batch", "per_member"; empty means auto.
BatchMode   ParseBatchMode(const std::string& value);
const char* BatchModeName(BatchMode mode);

struct DispatchOptions {
  std::vector<std::string>  devices;
  BatchMode                 batch_mode = BatchMode::kAuto;
  std::filesystem::path     output_dir;
  std::filesystem::path     log_dir;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(30)};
  const std::atomic<bool>*  cancel = nullptr;
};

/*
  Runs one backend over a planned ensemble.

  Members are assigned to devices round-robin. Each device gets its own
  thread; members sharing a device run one after another, or as a single
  batch invocation when the backend batches. A member succeeds only if its
  process exited 0 and its structure file exists and is non-empty; any
  other outcome becomes a failure marker on that member carrying the
  captured output. Members come back sorted by seed index.
*/
class PredictorDispatcher {
 public:
  explicit PredictorDispatcher(DispatchOptions options);

  rnaflow::pipeline::v1::EnsembleResult Run(const PredictorBackend& backend, const PredictionInput& input,
                                            std::vector<rnaflow::pipeline::v1::EnsembleMember> members) const;

  // Throws util::ConfigurationError when batching is forced on a backend without it.
  static bool UseBatch(const PredictorBackend& backend, BatchMode mode);

 private:
  using Member = rnaflow::pipeline::v1::EnsembleMember;

  void RunDevice(const PredictorBackend& backend, const PredictionInput& input, const std::string& device, bool batch,
                 std::vector<Member>& members) const;
  bool Cancelled() const;

  DispatchOptions options_;
};

} // namespace rnaflow::predictor
