#pragma once

#include <atomic>

namespace rnaflow::runtime {

/*
  Process-wide interrupt flag.

  Set from the SIGINT/SIGTERM handler; polled by the subprocess runner and the
  stage orchestrator.
*/
std::atomic<bool>& InterruptFlag();

void InstallSignalHandlers();

} // namespace rnaflow::runtime
