#include "state_machine.hpp"

namespace rnaflow::model {

const char* StatusName(StageStatus status) {
  switch (status) {
    case rnaflow::pipeline::v1::STAGE_STATUS_PENDING:
      return "pending";
    case rnaflow::pipeline::v1::STAGE_STATUS_RUNNING:
      return "running";
    case rnaflow::pipeline::v1::STAGE_STATUS_COMPLETED:
      return "completed";
    case rnaflow::pipeline::v1::STAGE_STATUS_FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

} // namespace rnaflow::model
