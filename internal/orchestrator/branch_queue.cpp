#include "branch_queue.hpp"

namespace rnaflow::orchestrator {

void BranchResultQueue::Push(BranchResult result) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(result));
  }
  cv_.notify_one();
}

BranchResult BranchResultQueue::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return !queue_.empty(); });

  BranchResult result = std::move(queue_.front());
  queue_.pop();
  return result;
}

} // namespace rnaflow::orchestrator
