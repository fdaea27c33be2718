#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/process/subprocess.hpp"

namespace rnaflow::predictor {

// Files produced by the upstream stages; msa and dot_bracket may be empty.
struct PredictionInput {
  std::filesystem::path fasta;
  std::string           sequence_id;
  std::string           sequence;
  std::filesystem::path msa;
  std::string           dot_bracket;
};

struct MemberRequest {
  int          seed_index  = 0;
  std::int64_t seed        = 0;
  bool         dropout     = false;
  double       noise_scale = 0.0;
};

struct InvocationContext {
  std::string               device;
  std::filesystem::path     output_dir;
  std::filesystem::path     log_dir;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(30)};
  const std::atomic<bool>*  cancel = nullptr;
};

struct MemberOutcome {
  int                    seed_index = 0;
  // Where the adapter expects the structure; validated by the dispatcher.
  std::filesystem::path  structure_path;
  process::ProcessResult process;
  // Adapter-level error that happened before or after the process ran.
  std::string            error;
};

/*
  One structure-prediction backend.

  Adapters only build command lines and locate outputs; success is judged
  by the dispatcher (exit status and a non-empty structure file). Calls may
  come from several device threads at once, so adapters keep no mutable
  state.
*/
class PredictorBackend {
 public:
  virtual ~PredictorBackend() = default;

  virtual std::string Name() const        = 0;
  virtual bool        IsAvailable() const = 0;
  // Canonical description of the adapter settings, part of the stage fingerprint.
  virtual std::string Descriptor() const  = 0;

  virtual bool         SupportsBatch() const;
  virtual std::int64_t SeedFor(int seed_index) const;

  virtual MemberOutcome Predict(const PredictionInput& input, const MemberRequest& member,
                                const InvocationContext& context) const = 0;

  // One process for all members; the default throws util::InvalidState.
  virtual std::vector<MemberOutcome> PredictBatch(const PredictionInput& input, const std::vector<MemberRequest>& members,
                                                  const InvocationContext& context) const;
};

} // namespace rnaflow::predictor
