#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace rnaflow::scoring {

struct ScoringCandidate {
  std::string structure_id;
  std::string backend;
  int         seed_index = 0;
  std::string path;
};

struct ScoredStructure {
  ScoringCandidate candidate;
  // Empty when the scorer produced nothing for this structure.
  std::vector<std::pair<std::string, double>> metrics;
};

struct ScoringContext {
  std::filesystem::path     work_dir;
  std::filesystem::path     log_dir;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(30)};
  const std::atomic<bool>*  cancel = nullptr;
};

// External structure-quality scorer, treated as a black box.
class Scorer {
 public:
  virtual ~Scorer() = default;

  virtual std::string Name() const        = 0;
  virtual bool        IsAvailable() const = 0;
  virtual std::string Descriptor() const  = 0;

  // One entry per candidate, in candidate order.
  virtual std::vector<ScoredStructure> Score(const std::vector<ScoringCandidate>& candidates, const std::filesystem::path& input_fasta,
                                             const ScoringContext& context) const = 0;
};

} // namespace rnaflow::scoring
