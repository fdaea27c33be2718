#pragma once

#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::model {

using rnaflow::pipeline::v1::StageStatus;

constexpr bool IsTerminal(StageStatus status) {
  return status == rnaflow::pipeline::v1::STAGE_STATUS_COMPLETED || status == rnaflow::pipeline::v1::STAGE_STATUS_FAILED;
}

/*
  Stage lifecycle:

      pending → running → completed | failed
      failed  → running | pending
      any     → pending             (invalidation, resume)
      pending → failed              (upstream failure, never executed)

  completed is only reachable from running.
*/
constexpr bool CanTransition(StageStatus from, StageStatus to) {
  using namespace rnaflow::pipeline::v1;

  if (from == to) {
    return from != STAGE_STATUS_RUNNING;
  }
  if (to == STAGE_STATUS_PENDING) {
    return true;
  }
  switch (from) {
    case STAGE_STATUS_PENDING:
      return to == STAGE_STATUS_RUNNING || to == STAGE_STATUS_FAILED;
    case STAGE_STATUS_RUNNING:
      return to == STAGE_STATUS_COMPLETED || to == STAGE_STATUS_FAILED;
    case STAGE_STATUS_FAILED:
      return to == STAGE_STATUS_RUNNING;
    case STAGE_STATUS_COMPLETED:
    default:
      return false;
  }
}

const char* StatusName(StageStatus status);

} // namespace rnaflow::model
