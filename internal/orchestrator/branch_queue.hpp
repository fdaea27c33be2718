#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::orchestrator {

// Outcome of one backend branch, reported back to the orchestrator thread.
struct BranchResult {
  std::string                           backend;
  rnaflow::pipeline::v1::EnsembleResult ensemble;
  // Set when the branch failed before producing any member.
  std::string                           error;
};

/*
  Thread-safe blocking queue carrying branch results to the orchestrator,
  the only thread that mutates and persists run state.
*/
class BranchResultQueue {
 public:
  void Push(BranchResult result);

  // Blocks until a result is available. Every branch pushes exactly once.
  BranchResult Pop();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<BranchResult> queue_;
};

} // namespace rnaflow::orchestrator
